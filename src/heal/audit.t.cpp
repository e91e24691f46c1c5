#include "test_util.h"

#include "heal/audit.h"

#include <fstream>
#include <sstream>

using namespace heal_test;

static std::string read_all(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static LedgerEvent make_event(LedgerEventType type, uint64_t id, const std::string& key,
                              uint64_t ts, uint64_t rid) {
    LedgerEvent e;
    e.type = type;
    e.id = id;
    e.system_key = key;
    e.timestamp = ts;
    e.request_id = rid;
    return e;
}

TEST_CASE("AuditCsvSinkAppends") {
    TempDir dir("audit");
    const std::string path = dir.file("audit.csv");

    {
        AuditCsvSink sink(path);
        sink.on_event(make_event(LedgerEventType::SUBMISSION_ACCEPTED, 1, "", 1000, 0));
        sink.on_event(make_event(LedgerEventType::DECRYPTION_REQUESTED, 1, "", 1001, 77));
        CHECK(sink.buffered() == 2);
        CHECK(sink.flush());
        CHECK(sink.buffered() == 0);

        sink.on_event(make_event(LedgerEventType::SUM_REVEALED, 0, "grid", 1002, 78));
    }

    CHECK(read_all(path) ==
          "timestamp,event,id,system_key,request_id\n"
          "1000,SubmissionAccepted,1,,0\n"
          "1001,DecryptionRequested,1,,77\n"
          "1002,SumRevealed,0,grid,78\n");

    // A second sink on the same file does not repeat the header.
    {
        AuditCsvSink sink(path);
        sink.on_event(make_event(LedgerEventType::DECRYPTION_EXPIRED, 2, "", 1003, 79));
    }
    CHECK(read_all(path).find("timestamp,event", 1) == std::string::npos);
    CHECK(read_all(path).find("1003,DecryptionExpired,2,,79\n") != std::string::npos);
}

TEST_CASE("AuditCsvSinkKeepsEventsWhenUnwritable") {
    TempDir dir("audit_unwritable");
    AuditCsvSink sink(dir.file("missing_dir/audit.csv"));
    sink.on_event(make_event(LedgerEventType::DATA_REVEALED, 3, "", 1000, 5));

    CHECK(!sink.flush());
    CHECK(sink.buffered() == 1);
}

TEST_CASE("ConsoleEventSink") {
    std::ostringstream out;
    ConsoleEventSink sink(out);

    sink.on_event(make_event(LedgerEventType::DATA_REVEALED, 3, "", 1000, 5));
    sink.on_event(make_event(LedgerEventType::SUM_DECRYPTION_REQUESTED, 0, "grid", 1001, 6));

    CHECK(out.str() ==
          "[event] DataRevealed id=3 request=5 at=1000\n"
          "[event] SumDecryptionRequested system=grid request=6 at=1001\n");
}

TEST_CASE("EventAndErrorNames") {
    CHECK(std::string(to_string(LedgerEventType::DECRYPTION_EXPIRED)) == "DecryptionExpired");
    CHECK(std::string(to_string(HEALErrorKind::NOT_FOUND)) == "NotFound");
    CHECK(std::string(to_string(HEALErrorKind::UNKNOWN_SYSTEM)) == "UnknownSystem");
    CHECK(std::string(to_string(HEALErrorKind::UNKNOWN_REQUEST)) == "UnknownRequest");
    CHECK(std::string(to_string(HEALErrorKind::ALREADY_REVEALED)) == "AlreadyRevealed");
    CHECK(std::string(to_string(HEALErrorKind::INVALID_PROOF)) == "InvalidProof");
    CHECK(std::string(to_string(HEALErrorKind::INVALID_ARGUMENT)) == "InvalidArgument");
    CHECK(std::string(to_string(HEALErrorKind::ALREADY_REJECTED)) == "AlreadyRejected");
    CHECK(std::string(to_string(HEALErrorKind::NOT_TENANT)) == "NotTenant");
    CHECK(std::string(to_string(LedgerEventType::SUBMISSION_REJECTED)) == "SubmissionRejected");
}

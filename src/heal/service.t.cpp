#include "test_util.h"

#include "heal/service.h"

#include <sstream>

using namespace heal_test;

namespace {

struct ServiceFixture {
    ManualClock clock;
    LocalDecryptionOracle oracle{test_system(), test_signing_key()};
    HEALLedger ledger{test_system(), oracle, HEALConfig{}, clock.fn()};
    LedgerService service{ledger, oracle, test_system()};
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceRevealFlow") {
    CHECK(service.handle("SUBMIT 5 1700000000 7") == "OK 1");
    CHECK(service.handle("SUBMIT 6 1700000060 9 alice north") == "OK 2");
    CHECK(service.handle("STATE 1") == "OK SEALED");

    const std::string req = service.handle("REVEAL 1");
    CHECK(starts_with(req, "OK "));
    CHECK(req != "OK 0");
    CHECK(service.handle("STATE 1") == "OK REQUESTED");
    CHECK(service.handle("REVEAL 1") == "ERR AlreadyRequested Submission 1 has a decryption in flight");

    CHECK(service.handle("FULFILL") == "OK 1 0");
    CHECK(service.handle("STATE 1") == "OK REVEALED");
    CHECK(service.handle("GET 1") == "OK 1 5 7 1700000000");
    CHECK(service.handle("GET 2") == "OK 0 0 0 0");

    CHECK(starts_with(service.handle("SUM central_system"), "OK ACCUMULATING 1 0 "));
    CHECK(service.handle("SUM north") == "ERR UnknownSystem Unknown system north");

    CHECK(starts_with(service.handle("REVEAL_SUM central_system"), "OK "));
    CHECK(service.handle("FULFILL") == "OK 1 0");
    CHECK(starts_with(service.handle("SUM central_system"), "OK SUM_REVEALED 1 7 "));

    CHECK(service.handle("KEYS") == "OK central_system");
    CHECK(service.handle("STATS") ==
          "OK submissions=2 revealed=1 rejected=0 pending=0 systems=1 usage=5 load=7");
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceSubmitCiphertextFile") {
    TempDir dir("service_ct");
    test_system().save_reading(test_system().encrypt_reading(3, 1700000900, 4),
                               dir.file("r.bin"));

    CHECK(service.handle("SUBMIT_CT " + dir.file("r.bin") + " meter south") == "OK 1");
    CHECK(starts_with(service.handle("REVEAL 1"), "OK "));
    CHECK(service.handle("FULFILL") == "OK 1 0");
    CHECK(service.handle("GET 1") == "OK 1 3 4 1700000900");
    CHECK(service.handle("KEYS") == "OK south");

    CHECK(starts_with(service.handle("SUBMIT_CT " + dir.file("missing.bin")), "ERR Error "));
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceExpire") {
    CHECK(service.handle("SUBMIT 1 2 3") == "OK 1");
    CHECK(starts_with(service.handle("REVEAL 1"), "OK "));

    clock.advance(10);
    CHECK(service.handle("EXPIRE 60") == "OK 0");
    CHECK(service.handle("EXPIRE 10") == "OK 1");
    CHECK(service.handle("STATE 1") == "OK SEALED");
    CHECK(service.handle("FULFILL") == "OK 0 1");
    CHECK(service.handle("EXPIRE") == "OK 0");
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceErrors") {
    CHECK(service.handle("GET 9") == "ERR NotFound Unknown submission 9");
    CHECK(service.handle("REVEAL 0") == "ERR NotFound Unknown submission 0");
    CHECK(service.handle("REVEAL_SUM nowhere") == "ERR UnknownSystem Unknown system nowhere");
    CHECK(service.handle("   ") == "ERR InvalidArgument empty command");
    CHECK(service.handle("BOGUS 1") == "ERR InvalidArgument unknown command BOGUS");
    CHECK(service.handle("SUBMIT 1 2") == "ERR InvalidArgument missing or bad load");
    CHECK(service.handle("GET x") == "ERR InvalidArgument missing or bad id");
    CHECK(service.handle("REVEAL_SUM") == "ERR InvalidArgument missing system key");

    // Still serving.
    CHECK(service.handle("SUBMIT 1 2 3") == "OK 1");
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceRunStopsAtQuit") {
    std::istringstream in(
        "SUBMIT 5 1700000000 7\n"
        "\n"
        "STATE 1\n"
        "QUIT\n"
        "SUBMIT 1 1 1\n");
    std::ostringstream out;

    service.run(in, out);

    CHECK(out.str() == "OK 1\nOK SEALED\nOK\n");
    CHECK(service.quit_requested());
    CHECK(ledger.summary().submissions == 1);
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceRejectAndList") {
    CHECK(service.handle("SUBMIT 5 1700000000 7 alice") == "OK 1");
    CHECK(service.handle("SUBMIT 6 1700000060 9 bob") == "OK 2");
    CHECK(service.handle("SUBMIT 1 1700000120 2 alice") == "OK 3");
    CHECK(service.handle("SUBMIT 1 1700000180 2") == "OK 4");

    CHECK(service.handle("LIST alice") == "OK 1 3");
    CHECK(service.handle("LIST") == "OK 4");
    CHECK(service.handle("LIST nobody") == "OK");

    CHECK(service.handle("REJECT 1 bob") == "ERR NotTenant Submission 1 is not owned by bob");
    CHECK(service.handle("REJECT 1 alice") == "OK");
    CHECK(service.handle("STATE 1") == "OK REJECTED");
    CHECK(service.handle("REJECT 1 alice") == "ERR AlreadyRejected Submission 1 was rejected");
    CHECK(service.handle("REVEAL 1") == "ERR AlreadyRejected Submission 1 was rejected");
    CHECK(service.handle("REJECT 4") == "OK");

    CHECK(starts_with(service.handle("STATS"), "OK submissions=4 revealed=0 rejected=2 "));
}

TEST_CASE_FIXTURE(ServiceFixture, "LedgerServiceRejectsMalformedNumbers") {
    CHECK(service.handle("SUBMIT 1 2 3") == "OK 1");
    CHECK(starts_with(service.handle("REVEAL 1"), "OK "));

    CHECK(service.handle("EXPIRE abc") == "ERR InvalidArgument bad max age abc");
    CHECK(service.handle("EXPIRE -1") == "ERR InvalidArgument bad max age -1");
    CHECK(service.handle("EXPIRE 99999999999999999999") ==
          "ERR InvalidArgument bad max age 99999999999999999999");
    CHECK(service.handle("STATE 1") == "OK REQUESTED");

    CHECK(service.handle("SUBMIT -5 1 1") == "ERR InvalidArgument missing or bad usage");
    CHECK(service.handle("SUBMIT 5x 1 1") == "ERR InvalidArgument missing or bad usage");
    CHECK(service.handle("GET 18446744073709551616") == "ERR InvalidArgument missing or bad id");
    CHECK(service.handle("GET +1") == "ERR InvalidArgument missing or bad id");
    CHECK(ledger.summary().submissions == 1);
}

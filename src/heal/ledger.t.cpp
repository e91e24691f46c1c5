#include "test_util.h"

#include "heal/ledger.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace heal_test;

namespace {

struct LedgerFixture {
    ManualClock clock;
    LocalDecryptionOracle oracle{test_system(), test_signing_key()};
    RecordingSink sink;
    HEALLedger ledger{test_system(), oracle, HEALConfig{}, clock.fn()};

    LedgerFixture() { ledger.add_sink(&sink); }
};

} // namespace

TEST_CASE_FIXTURE(LedgerFixture, "LedgerRevealsEveryReading") {
    const std::vector<uint64_t> loads{5, 7, 9};
    std::vector<uint64_t> ids;
    for (size_t i = 0; i < loads.size(); i++) {
        ids.push_back(ledger.submit_plain(100 + i, 1700000000 + i, loads[i], "tenant"));
    }
    CHECK(ids == std::vector<uint64_t>{1, 2, 3});

    for (uint64_t id : ids) ledger.request_reveal(id);
    CHECK(ledger.pending_count() == 3);

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 3);
    CHECK(report.rejected == 0);

    for (size_t i = 0; i < ids.size(); i++) {
        RevealRecord r = ledger.get(ids[i]);
        CHECK(r.revealed);
        CHECK(r.usage == 100 + i);
        CHECK(r.reading_timestamp == 1700000000 + i);
        CHECK(r.load == loads[i]);
    }

    // Default accumulator from the config.
    CHECK(ledger.system_keys() == std::vector<std::string>{kDefaultSystemKey});
    CHECK(test_system().decrypt(ledger.get_sum(kDefaultSystemKey)) == 21);

    ledger.request_sum_reveal(kDefaultSystemKey);
    CHECK(ledger.sum_state(kDefaultSystemKey) == SumState::REQUESTED_SUM);
    oracle.fulfill();

    AggregateState st = ledger.get_aggregate(kDefaultSystemKey);
    CHECK(st.state == SumState::SUM_REVEALED);
    CHECK(st.revealed_sum == 21);
    CHECK(st.revealed_contributions == 3);

    LedgerSummary s = ledger.summary();
    CHECK(s.submissions == 3);
    CHECK(s.revealed == 3);
    CHECK(s.total_revealed_load == 21);
    CHECK(s.total_revealed_usage == 303);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerSystemKeys") {
    uint64_t a = ledger.submit_plain(1, 1, 10, "alice", "north");
    uint64_t b = ledger.submit_plain(1, 1, 20, "bob", "south");
    uint64_t c = ledger.submit_plain(1, 1, 30, "carol", "north");
    CHECK(ledger.get_submission(a).tenant == "alice");
    CHECK(ledger.get_submission(b).system_key == "south");

    for (uint64_t id : {a, b, c}) ledger.request_reveal(id);
    oracle.fulfill();

    CHECK(test_system().decrypt(ledger.get_sum("north")) == 40);
    CHECK(test_system().decrypt(ledger.get_sum("south")) == 20);
    CHECK(ledger.resolve_system_key(hash_system_key("south")) == "south");
    CHECK(error_kind_of([&] { ledger.get_sum(kDefaultSystemKey); }) ==
          HEALErrorKind::UNKNOWN_SYSTEM);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerSubmitCiphertext") {
    EncryptedReading reading = test_system().encrypt_reading(8, 1700000500, 3);
    uint64_t id = ledger.submit(reading, "meter-9");

    // The ledger keeps the ciphertexts it was handed.
    CHECK(ledger.get_submission(id).reading.load == reading.load);
    CHECK(ledger.reveal_state(id) == RevealState::SEALED);
    CHECK(!ledger.get(id).revealed);
    CHECK(ledger.is_available());
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerTamperedProof") {
    uint64_t id = ledger.submit_plain(5, 1700000000, 7);
    ledger.request_reveal(id);

    std::vector<DecryptionResponse> responses = oracle.process();
    REQUIRE(responses.size() == 1);
    const DecryptionResponse& resp = responses[0];

    DecryptionProof bad = resp.proof;
    bad[31] ^= 0x80;
    CHECK(error_kind_of([&] { ledger.on_reveal_callback(resp.request_id, resp.plaintexts, bad); }) ==
          HEALErrorKind::INVALID_PROOF);
    CHECK(!ledger.get(id).revealed);
    CHECK(ledger.reveal_state(id) == RevealState::REQUESTED);

    LocalDecryptionOracle::deliver(resp);
    CHECK(ledger.get(id).revealed);
    CHECK(ledger.get(id).load == 7);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerDuplicateCallback") {
    uint64_t id = ledger.submit_plain(5, 1700000000, 7);
    ledger.request_reveal(id);

    std::vector<DecryptionResponse> responses = oracle.process();
    REQUIRE(responses.size() == 1);
    LocalDecryptionOracle::deliver(responses[0]);

    const RevealRecord before = ledger.get(id);
    const LedgerSummary s_before = ledger.summary();
    const size_t n_events = sink.events.size();

    clock.advance(60);
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(responses[0]); }) ==
          HEALErrorKind::ALREADY_REVEALED);

    const RevealRecord after = ledger.get(id);
    CHECK(after.revealed_at == before.revealed_at);
    CHECK(after.load == before.load);
    CHECK(ledger.summary().revealed == s_before.revealed);
    CHECK(ledger.get_aggregate(kDefaultSystemKey).contributions == 1);
    CHECK(sink.events.size() == n_events);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerForgedCallbacks") {
    const std::vector<uint64_t> pts{1, 2, 3};
    const RequestId forged = 0x1234567890ABCDEFULL;
    CHECK(error_kind_of([&] {
              ledger.on_reveal_callback(forged, pts,
                                        compute_decryption_proof(test_signing_key(), forged, pts));
          }) == HEALErrorKind::UNKNOWN_REQUEST);
    CHECK(error_kind_of([&] {
              ledger.on_sum_reveal_callback(forged, 6,
                                            compute_decryption_proof(test_signing_key(), forged, {6}));
          }) == HEALErrorKind::UNKNOWN_REQUEST);
    CHECK(ledger.summary().revealed == 0);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerErrorsAreReported") {
    CHECK(error_kind_of([&] { ledger.get(1); }) == HEALErrorKind::NOT_FOUND);
    CHECK(error_kind_of([&] { ledger.request_reveal(1); }) == HEALErrorKind::NOT_FOUND);

    ledger.submit_plain(1, 1, 1);
    CHECK(error_kind_of([&] { ledger.request_sum_reveal(kDefaultSystemKey); }) ==
          HEALErrorKind::UNKNOWN_SYSTEM);

    ledger.request_reveal(1);
    CHECK(error_kind_of([&] { ledger.request_reveal(1); }) == HEALErrorKind::ALREADY_REQUESTED);
    oracle.fulfill();
    CHECK(error_kind_of([&] { ledger.request_reveal(1); }) == HEALErrorKind::ALREADY_REVEALED);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerExpiresWithConfiguredTtl") {
    uint64_t id = ledger.submit_plain(5, 1700000000, 7);
    ledger.request_reveal(id);

    clock.advance(kDefaultRequestTtl - 1);
    CHECK(ledger.expire_requests() == 0);
    clock.advance(1);
    CHECK(ledger.expire_requests() == 1);
    CHECK(ledger.reveal_state(id) == RevealState::SEALED);
    CHECK(sink.events.back().type == LedgerEventType::DECRYPTION_EXPIRED);

    // The queued answer is rejected; a fresh request goes through.
    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 0);
    CHECK(report.rejected == 1);

    ledger.request_reveal(id);
    report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(ledger.get(id).revealed);
}

TEST_CASE("LedgerMetrics") {
    TempDir dir("ledger_metrics");
    ManualClock clock;
    LocalDecryptionOracle oracle(test_system(), test_signing_key());
    HEALLedger ledger(test_system(), oracle, HEALConfig{}, clock.fn());

    StatsCsvSink metrics(dir.file("metrics.csv"));
    ledger.set_metrics(&metrics);

    uint64_t id = ledger.submit_plain(1, 2, 3);
    ledger.request_reveal(id);
    CHECK(error_kind_of([&] { ledger.request_reveal(99); }) == HEALErrorKind::NOT_FOUND);

    CHECK(metrics.count("ledger", "submit", "ok") == 1);
    CHECK(metrics.count("ledger", "encrypt_reading", "ok") == 1);
    CHECK(metrics.count("ledger", "request_reveal", "ok") == 1);
    CHECK(metrics.count("ledger", "request_reveal", "NotFound") == 1);

    metrics.flush();
    std::ifstream in(dir.file("metrics.csv"));
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string csv = ss.str();
    CHECK(csv.rfind("component,op,outcome,count,mean_us,stddev_us,min_us,max_us\n", 0) == 0);
    CHECK(csv.find("ledger,request_reveal,NotFound,1,") != std::string::npos);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerBadReadingDoesNotSinkBatch") {
    // A load encrypted in timestamp limbs decrypts far past the plaintext modulus.
    EncryptedReading poisoned = test_system().encrypt_reading(1, 1700000000, 0);
    poisoned.load = test_system().encrypt_timestamp(1700000000);
    uint64_t bad = ledger.submit(poisoned, "mallory");
    uint64_t good = ledger.submit_plain(4, 1700000100, 6, "alice");

    ledger.request_reveal(bad);
    ledger.request_reveal(good);

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(report.rejected == 1);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0].rfind("InvalidArgument ", 0) == 0);

    CHECK(ledger.reveal_state(good) == RevealState::REVEALED);
    CHECK(ledger.get(good).load == 6);
    CHECK(ledger.reveal_state(bad) == RevealState::REQUESTED);
    CHECK(!ledger.get(bad).revealed);

    AggregateState st = ledger.get_aggregate(kDefaultSystemKey);
    CHECK(st.contributions == 1);
    CHECK(st.plain_total == 6);
    CHECK(test_system().decrypt(ledger.get_sum(kDefaultSystemKey)) == 6);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerTenantRejectsSubmission") {
    uint64_t a = ledger.submit_plain(1, 1700000000, 2, "alice");
    uint64_t b = ledger.submit_plain(3, 1700000010, 4, "bob");
    uint64_t c = ledger.submit_plain(5, 1700000020, 6, "alice");
    CHECK(ledger.submissions_of("alice") == std::vector<uint64_t>{a, c});
    CHECK(ledger.submissions_of("bob") == std::vector<uint64_t>{b});
    CHECK(ledger.submissions_of("carol").empty());

    CHECK(error_kind_of([&] { ledger.reject(a, "bob"); }) == HEALErrorKind::NOT_TENANT);
    CHECK(error_kind_of([&] { ledger.reject(99, "alice"); }) == HEALErrorKind::NOT_FOUND);

    ledger.reject(a, "alice");
    CHECK(ledger.reveal_state(a) == RevealState::REJECTED);
    CHECK(ledger.get(a).rejected);
    CHECK(ledger.get(a).rejected_at == clock.now());
    CHECK(sink.events.back().type == LedgerEventType::SUBMISSION_REJECTED);
    CHECK(sink.events.back().id == a);

    CHECK(error_kind_of([&] { ledger.reject(a, "alice"); }) == HEALErrorKind::ALREADY_REJECTED);
    CHECK(error_kind_of([&] { ledger.request_reveal(a); }) == HEALErrorKind::ALREADY_REJECTED);

    // In flight, then revealed: both too late to reject.
    ledger.request_reveal(c);
    CHECK(error_kind_of([&] { ledger.reject(c, "alice"); }) == HEALErrorKind::ALREADY_REQUESTED);
    oracle.fulfill();
    CHECK(error_kind_of([&] { ledger.reject(c, "alice"); }) == HEALErrorKind::ALREADY_REVEALED);

    LedgerSummary s = ledger.summary();
    CHECK(s.submissions == 3);
    CHECK(s.revealed == 1);
    CHECK(s.rejected == 1);
    CHECK(ledger.get_aggregate(kDefaultSystemKey).contributions == 1);
}

TEST_CASE_FIXTURE(LedgerFixture, "LedgerRepeatedSumRevealsStayBounded") {
    uint64_t id = ledger.submit_plain(1, 1700000000, 3);
    ledger.request_reveal(id);
    oracle.fulfill();
    const size_t base = ledger.tracked_requests();

    std::vector<DecryptionResponse> first;
    for (int i = 0; i < 20; i++) {
        ledger.request_sum_reveal(kDefaultSystemKey);
        std::vector<DecryptionResponse> responses = oracle.process();
        REQUIRE(responses.size() == 1);
        LocalDecryptionOracle::deliver(responses[0]);
        if (i == 0) first = responses;
        CHECK(ledger.tracked_requests() == base + 1);
    }

    CHECK(ledger.get_aggregate(kDefaultSystemKey).revealed_sum == 3);
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(first[0]); }) ==
          HEALErrorKind::UNKNOWN_REQUEST);
}

TEST_CASE("LedgerMetricsLabelEncryptionFailures") {
    ManualClock clock;
    LocalDecryptionOracle oracle(test_system(), test_signing_key());
    HEALLedger ledger(test_system(), oracle, HEALConfig{}, clock.fn());
    TempDir dir("ledger_metrics_error");
    StatsCsvSink metrics(dir.file("metrics.csv"));
    ledger.set_metrics(&metrics);

    CHECK_THROWS_AS(ledger.submit_plain(786433, 1700000000, 1), std::runtime_error);
    CHECK(metrics.count("ledger", "encrypt_reading", "Error") == 1);
    CHECK(metrics.count("ledger", "encrypt_reading", "ok") == 0);
    CHECK(ledger.summary().submissions == 0);
}

TEST_CASE("StatsCsvSinkDestroysQuietlyWhenUnwritable") {
    TempDir dir("metrics_unwritable");
    CHECK_NOTHROW([&] {
        StatsCsvSink metrics(dir.file("missing_dir/metrics.csv"));
        metrics.add("ledger", "submit", "ok", 12);
    }());
}

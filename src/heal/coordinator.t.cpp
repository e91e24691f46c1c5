#include "test_util.h"

#include "heal/coordinator.h"

using namespace heal_test;

namespace {

struct CoordinatorFixture {
    ManualClock clock;
    CiphertextStore ciphertexts;
    RevealStore reveals;
    Aggregator aggregator{test_system()};
    ScriptedOracle oracle{test_signing_key()};
    RecordingSink sink;
    DecryptionCoordinator coordinator{ciphertexts, reveals, aggregator, oracle, clock.fn()};

    CoordinatorFixture() { coordinator.add_sink(&sink); }

    uint64_t admit(uint64_t usage, uint64_t ts, uint64_t load, const std::string& key = "grid") {
        return coordinator.admit(test_system().encrypt_reading(usage, ts, load), "tenant", key);
    }

    // Requests and settles a reveal through the oracle's own callback.
    void reveal(uint64_t id) {
        coordinator.request_reveal(id);
        LocalDecryptionOracle::deliver(oracle.respond(oracle.requests.size() - 1));
    }
};

} // namespace

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorRevealLifecycle") {
    uint64_t id = admit(5, 1700000000, 7);
    CHECK(coordinator.reveal_state(id) == RevealState::SEALED);
    CHECK(!coordinator.reveal_record(id).revealed);

    RequestId rid = coordinator.request_reveal(id);
    CHECK(coordinator.reveal_state(id) == RevealState::REQUESTED);
    CHECK(coordinator.pending_count() == 1);
    REQUIRE(oracle.requests.size() == 1);
    CHECK(oracle.requests[0].cts.size() == 3);

    clock.advance(5);
    LocalDecryptionOracle::deliver(oracle.respond(0));

    CHECK(coordinator.reveal_state(id) == RevealState::REVEALED);
    CHECK(coordinator.pending_count() == 0);

    RevealRecord r = coordinator.reveal_record(id);
    CHECK(r.revealed);
    CHECK(r.usage == 5);
    CHECK(r.load == 7);
    CHECK(r.reading_timestamp == 1700000000);
    CHECK(r.revealed_at == 1005);

    CHECK(coordinator.aggregate("grid").contributions == 1);
    CHECK(test_system().decrypt(coordinator.sum("grid")) == 7);

    REQUIRE(sink.events.size() == 3);
    CHECK(sink.types() == std::vector<LedgerEventType>{LedgerEventType::SUBMISSION_ACCEPTED,
                                                       LedgerEventType::DECRYPTION_REQUESTED,
                                                       LedgerEventType::DATA_REVEALED});
    CHECK(sink.events[0].id == id);
    CHECK(sink.events[0].timestamp == 1000);
    CHECK(sink.events[1].request_id == rid);
    CHECK(sink.events[2].request_id == rid);
    CHECK(sink.events[2].timestamp == 1005);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorRequestRules") {
    CHECK(error_kind_of([&] { coordinator.request_reveal(0); }) == HEALErrorKind::NOT_FOUND);
    CHECK(error_kind_of([&] { coordinator.request_reveal(1); }) == HEALErrorKind::NOT_FOUND);

    uint64_t id = admit(1, 2, 3);
    coordinator.request_reveal(id);

    // One decryption in flight per submission.
    CHECK(error_kind_of([&] { coordinator.request_reveal(id); }) ==
          HEALErrorKind::ALREADY_REQUESTED);
    CHECK(oracle.requests.size() == 1);

    LocalDecryptionOracle::deliver(oracle.respond(0));
    CHECK(error_kind_of([&] { coordinator.request_reveal(id); }) ==
          HEALErrorKind::ALREADY_REVEALED);
    CHECK(oracle.requests.size() == 1);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorCallbackRejections") {
    uint64_t id = admit(5, 1700000000, 7);
    RequestId rid = coordinator.request_reveal(id);
    DecryptionResponse resp = oracle.respond(0);
    const size_t n_events = sink.events.size();

    SUBCASE("forged request id") {
        const std::vector<uint64_t> pts{1, 2, 3};
        CHECK(error_kind_of([&] {
                  coordinator.on_reveal_callback(rid + 1, pts, oracle.sign(rid + 1, pts));
              }) == HEALErrorKind::UNKNOWN_REQUEST);
    }

    SUBCASE("tampered proof") {
        DecryptionProof bad = resp.proof;
        bad[0] ^= 0x01;
        CHECK(error_kind_of([&] { coordinator.on_reveal_callback(rid, resp.plaintexts, bad); }) ==
              HEALErrorKind::INVALID_PROOF);
    }

    SUBCASE("tampered plaintexts") {
        std::vector<uint64_t> pts = resp.plaintexts;
        pts[2] += 1;
        CHECK(error_kind_of([&] { coordinator.on_reveal_callback(rid, pts, resp.proof); }) ==
              HEALErrorKind::INVALID_PROOF);
    }

    SUBCASE("wrong plaintext count") {
        const std::vector<uint64_t> pts{5, 7};
        CHECK(error_kind_of([&] { coordinator.on_reveal_callback(rid, pts, oracle.sign(rid, pts)); }) ==
              HEALErrorKind::INVALID_ARGUMENT);
    }

    SUBCASE("load past the plaintext modulus") {
        const std::vector<uint64_t> pts{5, 1700000000, 786433};
        CHECK(error_kind_of([&] { coordinator.on_reveal_callback(rid, pts, oracle.sign(rid, pts)); }) ==
              HEALErrorKind::INVALID_ARGUMENT);
    }

    // Nothing moved.
    CHECK(coordinator.reveal_state(id) == RevealState::REQUESTED);
    CHECK(!coordinator.reveal_record(id).revealed);
    CHECK(coordinator.system_keys().empty());
    CHECK(sink.events.size() == n_events);

    // The genuine answer still lands.
    coordinator.on_reveal_callback(rid, resp.plaintexts, resp.proof);
    CHECK(coordinator.reveal_state(id) == RevealState::REVEALED);
    CHECK(coordinator.reveal_record(id).load == 7);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorDuplicateCallback") {
    uint64_t id = admit(5, 1700000000, 7);
    coordinator.request_reveal(id);
    DecryptionResponse resp = oracle.respond(0);

    LocalDecryptionOracle::deliver(resp);
    const RevealRecord before = coordinator.reveal_record(id);
    const size_t n_events = sink.events.size();

    clock.advance(100);
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(resp); }) ==
          HEALErrorKind::ALREADY_REVEALED);
    CHECK(error_kind_of([&] {
              coordinator.on_reveal_callback(resp.request_id, resp.plaintexts, resp.proof);
          }) == HEALErrorKind::ALREADY_REVEALED);

    const RevealRecord after = coordinator.reveal_record(id);
    CHECK(after.revealed_at == before.revealed_at);
    CHECK(after.usage == before.usage);
    CHECK(coordinator.aggregate("grid").contributions == 1);
    CHECK(test_system().decrypt(coordinator.sum("grid")) == 7);
    CHECK(sink.events.size() == n_events);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorCrossKindCallbacks") {
    reveal(admit(1, 1, 10));
    RequestId sum_rid = coordinator.request_sum_reveal("grid");

    uint64_t id2 = admit(2, 2, 20);
    RequestId rid2 = coordinator.request_reveal(id2);

    CHECK(error_kind_of([&] {
              coordinator.on_sum_reveal_callback(rid2, 10, oracle.sign(rid2, {10}));
          }) == HEALErrorKind::UNKNOWN_REQUEST);

    const std::vector<uint64_t> pts{1, 2, 3};
    CHECK(error_kind_of([&] {
              coordinator.on_reveal_callback(sum_rid, pts, oracle.sign(sum_rid, pts));
          }) == HEALErrorKind::UNKNOWN_REQUEST);

    CHECK(coordinator.pending_count() == 2);
    CHECK(coordinator.reveal_state(id2) == RevealState::REQUESTED);
    CHECK(coordinator.sum_state("grid") == SumState::REQUESTED_SUM);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorRequestIdCollision") {
    uint64_t id1 = admit(1, 100, 10);
    uint64_t id2 = admit(2, 200, 20);

    oracle.next_ids = {7, 7};
    CHECK(coordinator.request_reveal(id1) == 7);
    CHECK(error_kind_of([&] { coordinator.request_reveal(id2); }) ==
          HEALErrorKind::REQUEST_COLLISION);

    CHECK(coordinator.reveal_state(id2) == RevealState::SEALED);
    CHECK(coordinator.pending_count() == 1);

    // The oracle still answers the orphaned request; it must not settle id1.
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(oracle.respond(1)); }) ==
          HEALErrorKind::UNKNOWN_REQUEST);
    CHECK(coordinator.reveal_state(id1) == RevealState::REQUESTED);
    CHECK(!coordinator.reveal_record(id1).revealed);

    LocalDecryptionOracle::deliver(oracle.respond(0));
    CHECK(coordinator.reveal_record(id1).load == 10);

    // id2 can be requested again under a fresh id.
    reveal(id2);
    CHECK(coordinator.reveal_record(id2).load == 20);
    CHECK(test_system().decrypt(coordinator.sum("grid")) == 30);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorSumLifecycle") {
    CHECK(error_kind_of([&] { coordinator.request_sum_reveal("grid"); }) ==
          HEALErrorKind::UNKNOWN_SYSTEM);

    uint64_t a = admit(1, 1, 5);
    uint64_t b = admit(1, 2, 7);
    uint64_t c = admit(1, 3, 9);

    // Submitted but not yet revealed: nothing accumulated.
    CHECK(coordinator.sum_state("grid") == SumState::UNINITIALIZED);
    CHECK(error_kind_of([&] { coordinator.request_sum_reveal("grid"); }) ==
          HEALErrorKind::UNKNOWN_SYSTEM);

    reveal(a);
    reveal(b);
    reveal(c);
    CHECK(coordinator.sum_state("grid") == SumState::ACCUMULATING);

    RequestId rid = coordinator.request_sum_reveal("grid");
    CHECK(coordinator.sum_state("grid") == SumState::REQUESTED_SUM);
    CHECK(error_kind_of([&] { coordinator.request_sum_reveal("grid"); }) ==
          HEALErrorKind::ALREADY_REQUESTED);

    DecryptionResponse resp = oracle.respond(3);
    CHECK(resp.request_id == rid);
    CHECK(resp.plaintexts == std::vector<uint64_t>{21});

    clock.advance(9);
    LocalDecryptionOracle::deliver(resp);

    AggregateState st = coordinator.aggregate("grid");
    CHECK(st.state == SumState::SUM_REVEALED);
    CHECK(st.revealed_sum == 21);
    CHECK(st.revealed_contributions == 3);
    CHECK(st.revealed_at == 1009);

    CHECK(error_kind_of([&] { coordinator.on_sum_reveal_callback(rid, 21, resp.proof); }) ==
          HEALErrorKind::ALREADY_REVEALED);

    const LedgerEvent& last = sink.events.back();
    CHECK(last.type == LedgerEventType::SUM_REVEALED);
    CHECK(last.id == 0);
    CHECK(last.system_key == "grid");
    CHECK(last.request_id == rid);

    // A revealed sum can be requested again.
    coordinator.request_sum_reveal("grid");
    CHECK(coordinator.sum_state("grid") == SumState::REQUESTED_SUM);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorSumRejections") {
    reveal(admit(1, 1, 4));
    RequestId rid = coordinator.request_sum_reveal("grid");

    CHECK(error_kind_of([&] { coordinator.on_sum_reveal_callback(rid, 4, DecryptionProof{}); }) ==
          HEALErrorKind::INVALID_PROOF);
    CHECK(error_kind_of([&] { coordinator.on_sum_reveal_callback(rid, 5, oracle.sign(rid, {4})); }) ==
          HEALErrorKind::INVALID_PROOF);
    CHECK(error_kind_of([&] {
              coordinator.on_sum_reveal_callback(rid + 1, 4, oracle.sign(rid + 1, {4}));
          }) == HEALErrorKind::UNKNOWN_REQUEST);

    CHECK(coordinator.sum_state("grid") == SumState::REQUESTED_SUM);
    CHECK(!coordinator.aggregate("grid").ever_revealed);

    coordinator.on_sum_reveal_callback(rid, 4, oracle.sign(rid, {4}));
    CHECK(coordinator.aggregate("grid").revealed_sum == 4);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorSumSnapshot") {
    reveal(admit(1, 1, 4));
    coordinator.request_sum_reveal("grid");
    const size_t sum_request = oracle.requests.size() - 1;

    // A contribution that lands while the sum is in flight is not part of it.
    reveal(admit(1, 2, 6));
    CHECK(coordinator.sum_state("grid") == SumState::REQUESTED_SUM);
    CHECK(coordinator.aggregate("grid").contributions == 2);

    LocalDecryptionOracle::deliver(oracle.respond(sum_request));
    AggregateState st = coordinator.aggregate("grid");
    CHECK(st.revealed_sum == 4);
    CHECK(st.revealed_contributions == 1);
    CHECK(st.contributions == 2);
    CHECK(test_system().decrypt(coordinator.sum("grid")) == 10);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorExpireReveal") {
    uint64_t id = admit(5, 1700000000, 7);
    RequestId rid = coordinator.request_reveal(id);

    clock.advance(30);
    CHECK(coordinator.expire_requests(60) == 0);
    CHECK(coordinator.reveal_state(id) == RevealState::REQUESTED);

    clock.advance(30);
    CHECK(coordinator.expire_requests(60) == 1);
    CHECK(coordinator.reveal_state(id) == RevealState::SEALED);
    CHECK(coordinator.pending_count() == 0);

    const LedgerEvent& e = sink.events.back();
    CHECK(e.type == LedgerEventType::DECRYPTION_EXPIRED);
    CHECK(e.id == id);
    CHECK(e.request_id == rid);
    CHECK(e.timestamp == 1060);

    // The late answer no longer maps to anything.
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(oracle.respond(0)); }) ==
          HEALErrorKind::UNKNOWN_REQUEST);
    CHECK(!coordinator.reveal_record(id).revealed);

    reveal(id);
    CHECK(coordinator.reveal_record(id).usage == 5);
    CHECK(oracle.requests[1].id != rid);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorExpireSum") {
    reveal(admit(1, 1, 4));

    coordinator.request_sum_reveal("grid");
    CHECK(coordinator.expire_requests(0) == 1);
    CHECK(coordinator.sum_state("grid") == SumState::ACCUMULATING);

    coordinator.request_sum_reveal("grid");
    LocalDecryptionOracle::deliver(oracle.respond(oracle.requests.size() - 1));
    coordinator.request_sum_reveal("grid");
    CHECK(coordinator.expire_requests(0) == 1);
    // Falls back to the last revealed snapshot.
    CHECK(coordinator.sum_state("grid") == SumState::SUM_REVEALED);
    CHECK(coordinator.aggregate("grid").revealed_sum == 4);

    // Settled requests never expire.
    CHECK(coordinator.expire_requests(0) == 0);
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorIdsAndSummary") {
    uint64_t prev = 0;
    for (uint64_t i = 0; i < 5; i++) {
        uint64_t id = admit(i, i, i, i % 2 ? "odd" : "even");
        CHECK(id > prev);
        prev = id;
    }
    CHECK(error_kind_of([&] { admit(1, 1, 1, ""); }) == HEALErrorKind::INVALID_ARGUMENT);

    reveal(2);
    reveal(3);
    reveal(4);

    LedgerSummary s = coordinator.summary();
    CHECK(s.submissions == 5);
    CHECK(s.revealed == 3);
    CHECK(s.pending_requests == 0);
    CHECK(s.system_keys == 2);
    CHECK(s.total_revealed_usage == 1 + 2 + 3);
    CHECK(s.total_revealed_load == 1 + 2 + 3);

    CHECK(coordinator.system_keys() == std::vector<std::string>{"odd", "even"});
    CHECK(coordinator.resolve(hash_system_key("odd")) == "odd");
    CHECK(coordinator.submission(3).system_key == "even");
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorRejectSealedSubmission") {
    uint64_t id = admit(5, 1700000000, 7);
    uint64_t other = admit(1, 1700000001, 2);

    CHECK(error_kind_of([&] { coordinator.reject(id, "someone-else"); }) ==
          HEALErrorKind::NOT_TENANT);
    CHECK(coordinator.reveal_state(id) == RevealState::SEALED);

    clock.advance(5);
    coordinator.reject(id, "tenant");
    CHECK(coordinator.reveal_state(id) == RevealState::REJECTED);
    CHECK(coordinator.reveal_record(id).rejected_at == 1005);
    CHECK(sink.types().back() == LedgerEventType::SUBMISSION_REJECTED);
    CHECK(oracle.requests.empty());

    CHECK(error_kind_of([&] { coordinator.request_reveal(id); }) ==
          HEALErrorKind::ALREADY_REJECTED);
    CHECK(error_kind_of([&] { coordinator.reject(id, "tenant"); }) ==
          HEALErrorKind::ALREADY_REJECTED);

    // Rejection never touches the aggregate.
    reveal(other);
    CHECK(coordinator.aggregate("grid").contributions == 1);
    CHECK(coordinator.aggregate("grid").plain_total == 2);

    LedgerSummary s = coordinator.summary();
    CHECK(s.rejected == 1);
    CHECK(s.revealed == 1);
    CHECK(s.total_revealed_load == 2);
    CHECK(coordinator.submissions_of("tenant") == std::vector<uint64_t>{id, other});
}

TEST_CASE_FIXTURE(CoordinatorFixture, "CoordinatorSupersededSumRequestIsForgotten") {
    reveal(admit(1, 1700000000, 4));
    CHECK(coordinator.tracked_requests() == 1);

    RequestId first = coordinator.request_sum_reveal("grid");
    DecryptionResponse first_resp = oracle.respond(oracle.requests.size() - 1);
    LocalDecryptionOracle::deliver(first_resp);
    CHECK(coordinator.tracked_requests() == 2);

    // Until superseded, a replay is a duplicate.
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(first_resp); }) ==
          HEALErrorKind::ALREADY_REVEALED);

    RequestId second = coordinator.request_sum_reveal("grid");
    CHECK(second != first);
    CHECK(coordinator.tracked_requests() == 2);
    CHECK(error_kind_of([&] { LocalDecryptionOracle::deliver(first_resp); }) ==
          HEALErrorKind::UNKNOWN_REQUEST);

    LocalDecryptionOracle::deliver(oracle.respond(oracle.requests.size() - 1));
    CHECK(coordinator.aggregate("grid").revealed_sum == 4);
    CHECK(coordinator.tracked_requests() == 2);
}

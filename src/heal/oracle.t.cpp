#include "test_util.h"

#include "heal/oracle.h"

#include <set>
#include <stdexcept>

using namespace heal_test;

TEST_CASE("DecryptionProofBindsEverything") {
    const SigningKey key = test_signing_key();
    const std::vector<uint64_t> pts{5, 1700000000, 7};
    const DecryptionProof proof = compute_decryption_proof(key, 42, pts);

    CHECK(compute_decryption_proof(key, 42, pts) == proof);
    CHECK(compute_decryption_proof(key, 43, pts) != proof);
    CHECK(compute_decryption_proof(key, 42, {5, 1700000000, 8}) != proof);
    CHECK(compute_decryption_proof(key, 42, {5, 1700000000}) != proof);
    CHECK(compute_decryption_proof(test_signing_key(0x01), 42, pts) != proof);
}

TEST_CASE("LocalOracleNeedsSecretKey") {
    HEALSystem keyless(HEALParams(1024, 786433, 1, HEStd_NotSet));
    CHECK_THROWS_AS([&] { LocalDecryptionOracle oracle(keyless, test_signing_key()); }(),
                    std::runtime_error);
}

TEST_CASE("LocalOracleQueuesUntilFulfilled") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    RequestId got_id = 0;
    std::vector<uint64_t> got;
    DecryptionProof got_proof{};

    RequestId rid = oracle.request_decryption(
        {system.encrypt(5), system.encrypt_timestamp(1700000000), system.encrypt(7)},
        [&](RequestId id, const std::vector<uint64_t>& pts, const DecryptionProof& proof) {
            got_id = id;
            got = pts;
            got_proof = proof;
        });

    CHECK(rid != 0);
    CHECK(oracle.queued() == 1);
    CHECK(got.empty());

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(report.rejected == 0);
    CHECK(oracle.queued() == 0);

    CHECK(got_id == rid);
    CHECK(got == std::vector<uint64_t>{5, 1700000000, 7});
    CHECK(oracle.check_signatures(rid, got, got_proof));
}

TEST_CASE("LocalOracleCheckSignatures") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    const std::vector<uint64_t> pts{21};
    DecryptionProof proof = compute_decryption_proof(test_signing_key(), 7, pts);
    CHECK(oracle.check_signatures(7, pts, proof));
    CHECK(!oracle.check_signatures(8, pts, proof));
    CHECK(!oracle.check_signatures(7, {22}, proof));

    proof[0] ^= 0x01;
    CHECK(!oracle.check_signatures(7, pts, proof));

    // Signed by someone else.
    CHECK(!oracle.check_signatures(7, pts, compute_decryption_proof(test_signing_key(0x77), 7, pts)));
}

TEST_CASE("LocalOracleRequestIdsAreFresh") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());
    auto ct = system.encrypt(1);

    std::set<RequestId> ids;
    for (int i = 0; i < 64; i++) {
        RequestId id = oracle.request_decryption(
            {ct}, [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {});
        CHECK(id != 0);
        ids.insert(id);
    }
    CHECK(ids.size() == 64);
}

TEST_CASE("LocalOracleProcessThenDeliver") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    int calls = 0;
    oracle.request_decryption(
        {system.encrypt(30)},
        [&](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) { calls++; });

    std::vector<DecryptionResponse> responses = oracle.process();
    REQUIRE(responses.size() == 1);
    CHECK(responses[0].plaintexts == std::vector<uint64_t>{30});
    CHECK(oracle.check_signatures(responses[0].request_id, responses[0].plaintexts,
                                  responses[0].proof));
    CHECK(calls == 0);

    LocalDecryptionOracle::deliver(responses[0]);
    CHECK(calls == 1);
}

TEST_CASE("LocalOracleFulfillCountsRejections") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    oracle.request_decryption(
        {system.encrypt(1)},
        [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {});
    oracle.request_decryption(
        {system.encrypt(2)},
        [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {
            throw HEALError(HEALErrorKind::UNKNOWN_REQUEST, "gone");
        });

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(report.rejected == 1);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0] == "UnknownRequest gone");
}

TEST_CASE("LocalOracleRejectsEmptyRequest") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    CHECK(error_kind_of([&] {
              oracle.request_decryption(
                  {}, [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {});
          }) == HEALErrorKind::INVALID_ARGUMENT);
    CHECK(error_kind_of([&] { oracle.request_decryption({system.encrypt(1)}, nullptr); }) ==
          HEALErrorKind::INVALID_ARGUMENT);
    CHECK(oracle.queued() == 0);
}

TEST_CASE("LocalOracleUndecryptableRequestLeavesBatchIntact") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    int bad_calls = 0;
    std::vector<uint64_t> got;
    RequestId bad = oracle.request_decryption(
        {CiphertextHandle()},
        [&](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) { bad_calls++; });
    oracle.request_decryption(
        {system.encrypt(11)},
        [&](RequestId, const std::vector<uint64_t>& pts, const DecryptionProof&) { got = pts; });

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(report.rejected == 1);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0] ==
          "DecryptionFailed request " + std::to_string(bad) + ": Null ciphertext");
    CHECK(bad_calls == 0);
    CHECK(got == std::vector<uint64_t>{11});
    CHECK(oracle.queued() == 0);
}

TEST_CASE("LocalOracleProcessReportsFailures") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());
    auto noop = [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {};

    oracle.request_decryption({system.encrypt(4)}, noop);
    oracle.request_decryption({system.encrypt(5), CiphertextHandle()}, noop);
    oracle.request_decryption({system.encrypt(6)}, noop);

    std::vector<std::string> failures;
    std::vector<DecryptionResponse> responses = oracle.process(&failures);
    REQUIRE(responses.size() == 2);
    CHECK(responses[0].plaintexts == std::vector<uint64_t>{4});
    CHECK(responses[1].plaintexts == std::vector<uint64_t>{6});
    CHECK(failures.size() == 1);
}

TEST_CASE("LocalOracleFulfillCountsThrowingCallback") {
    const HEALSystem& system = test_system();
    LocalDecryptionOracle oracle(system, test_signing_key());

    int calls = 0;
    oracle.request_decryption(
        {system.encrypt(1)},
        [](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) {
            throw std::runtime_error("disk full");
        });
    oracle.request_decryption(
        {system.encrypt(2)},
        [&](RequestId, const std::vector<uint64_t>&, const DecryptionProof&) { calls++; });

    FulfillReport report = oracle.fulfill();
    CHECK(report.delivered == 1);
    CHECK(report.rejected == 1);
    REQUIRE(report.errors.size() == 1);
    CHECK(report.errors[0] == "Error disk full");
    CHECK(calls == 1);
}

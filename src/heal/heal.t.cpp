#include "test_util.h"

#include "heal/heal.h"

#include <stdexcept>

using namespace heal_test;

TEST_CASE("HEALParamsValidate") {
    CHECK(HEALParams().validate_parameters());
    CHECK(HEALParams(1024, 786433, 1, HEStd_NotSet).validate_parameters());

    SUBCASE("ring dimension must be a power of two") {
        CHECK_THROWS_AS(HEALParams(1000, 786433).validate_parameters(), std::runtime_error);
        CHECK_THROWS_AS(HEALParams(0, 786433).validate_parameters(), std::runtime_error);
    }

    SUBCASE("plaintext modulus must allow packing") {
        // 12288 is not a multiple of 2 * 8192.
        CHECK_THROWS_AS(HEALParams(8192, 12289).validate_parameters(), std::runtime_error);
        CHECK_THROWS_AS(HEALParams(8192, 1).validate_parameters(), std::runtime_error);
    }
}

TEST_CASE("HEALParamsSaveLoad") {
    TempDir dir("params");
    HEALParams p(2048, 786433, 2, HEStd_NotSet);
    p.save(dir.file("params.bin"));

    HEALParams q = HEALParams::load(dir.file("params.bin"));
    CHECK(q.ring_dim == 2048);
    CHECK(q.plain_modulus == 786433);
    CHECK(q.mult_depth == 2);
    CHECK(q.sec_level == HEStd_NotSet);

    CHECK_THROWS_AS(HEALParams::load(dir.file("missing.bin")), std::runtime_error);
}

TEST_CASE("HEALSystemEncryptDecrypt") {
    const HEALSystem& system = test_system();
    REQUIRE(system.can_encrypt());
    REQUIRE(system.can_decrypt());

    CHECK(system.decrypt(system.encrypt(42)) == 42);
    CHECK(system.decrypt(system.encrypt_zero()) == 0);

    // Largest single-slot value.
    const uint64_t t = system.get_params().plain_modulus;
    CHECK(system.decrypt(system.encrypt(t - 1)) == t - 1);
    CHECK_THROWS_AS(system.encrypt(t), std::runtime_error);
}

TEST_CASE("HEALSystemAdd") {
    const HEALSystem& system = test_system();

    auto a = system.encrypt(10);
    auto b = system.encrypt(20);
    CHECK(system.decrypt(system.add(a, b)) == 30);
    CHECK(system.decrypt(system.add(b, a)) == 30);

    auto sum = system.encrypt_zero();
    for (uint64_t v : {5, 7, 9}) {
        sum = system.add(sum, system.encrypt(v));
    }
    CHECK(system.decrypt(sum) == 21);
}

TEST_CASE("HEALSystemTimestampLimbs") {
    const HEALSystem& system = test_system();

    // Wider than the plaintext modulus; travels as 16-bit limbs.
    const uint64_t ts_ms = 1700000000123ULL;
    CHECK(system.decrypt(system.encrypt_timestamp(ts_ms)) == ts_ms);
    CHECK(system.decrypt(system.encrypt_timestamp(0)) == 0);
    CHECK(system.decrypt(system.encrypt_timestamp(UINT64_MAX)) == UINT64_MAX);
}

TEST_CASE("HEALSystemEncryptReading") {
    const HEALSystem& system = test_system();

    EncryptedReading r = system.encrypt_reading(5, 1700000000, 7);
    CHECK(system.decrypt(r.usage) == 5);
    CHECK(system.decrypt(r.timestamp) == 1700000000);
    CHECK(system.decrypt(r.load) == 7);
}

TEST_CASE("HEALSystemWithoutKeys") {
    HEALSystem system(HEALParams(1024, 786433, 1, HEStd_NotSet));
    CHECK(!system.can_encrypt());
    CHECK(!system.can_decrypt());
    CHECK_THROWS_AS(system.encrypt(1), std::runtime_error);
    CHECK_THROWS_AS(system.decrypt(test_system().encrypt(1)), std::runtime_error);
    CHECK_THROWS_AS(system.save_public_key("unused.bin"), std::runtime_error);
}

TEST_CASE("HEALSystemReadingFiles") {
    const HEALSystem& system = test_system();
    TempDir dir("reading");

    system.save_reading(system.encrypt_reading(11, 1700000100, 13), dir.file("reading.bin"));
    EncryptedReading r = system.load_reading(dir.file("reading.bin"));
    CHECK(system.decrypt(r.usage) == 11);
    CHECK(system.decrypt(r.timestamp) == 1700000100);
    CHECK(system.decrypt(r.load) == 13);

    CHECK_THROWS_AS(system.load_reading(dir.file("missing.bin")), std::runtime_error);
    CHECK(system.serialized_size(r.load) > 0);
}

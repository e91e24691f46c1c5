#include "test_util.h"

#include "heal/aggregator.h"

using namespace heal_test;

TEST_CASE("HashSystemKey") {
    CHECK(to_hex(hash_system_key("")) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(to_hex(hash_system_key("abc")) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(hash_system_key("grid") == hash_system_key("grid"));
    CHECK(hash_system_key("grid") != hash_system_key("grid2"));
}

TEST_CASE("AggregatorAccumulates") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);
    CHECK(!agg.contains("grid"));

    agg.accumulate("grid", 10);
    CHECK(agg.contains("grid"));
    CHECK(agg.state("grid").state == SumState::ACCUMULATING);
    CHECK(agg.state("grid").contributions == 1);
    CHECK(system.decrypt(agg.get_sum("grid")) == 10);

    agg.accumulate("grid", 20);
    CHECK(agg.state("grid").contributions == 2);
    CHECK(system.decrypt(agg.get_sum("grid")) == 30);
}

TEST_CASE("AggregatorOrderIndependent") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);

    for (uint64_t v : {3, 11, 250, 4}) agg.accumulate("forward", v);
    for (uint64_t v : {4, 250, 11, 3}) agg.accumulate("backward", v);

    CHECK(system.decrypt(agg.get_sum("forward")) == 268);
    CHECK(system.decrypt(agg.get_sum("backward")) == 268);
}

TEST_CASE("AggregatorKeysRegisterOnce") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);

    agg.accumulate("b", 1);
    agg.accumulate("a", 1);
    agg.accumulate("b", 1);

    REQUIRE(agg.system_keys().size() == 2);
    CHECK(agg.system_keys()[0] == "b");
    CHECK(agg.system_keys()[1] == "a");

    CHECK(agg.resolve(hash_system_key("a")) == "a");
    CHECK(agg.resolve(hash_system_key("b")) == "b");
    CHECK(error_kind_of([&] { agg.resolve(hash_system_key("c")); }) ==
          HEALErrorKind::UNKNOWN_SYSTEM);
}

TEST_CASE("AggregatorUnknownSystem") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);

    CHECK(error_kind_of([&] { agg.get_sum("nowhere"); }) == HEALErrorKind::UNKNOWN_SYSTEM);
    CHECK(error_kind_of([&] { agg.state("nowhere"); }) == HEALErrorKind::UNKNOWN_SYSTEM);
    CHECK(error_kind_of([&] { agg.accumulate("", 1); }) == HEALErrorKind::INVALID_ARGUMENT);
}

TEST_CASE("AggregatorStageLeavesStateAlone") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);

    CiphertextHandle staged = agg.stage("grid", 9);
    CHECK(system.decrypt(staged) == 9);
    CHECK(!agg.contains("grid"));
    CHECK(agg.system_keys().empty());

    agg.commit("grid", staged, 9);
    CHECK(agg.state("grid").contributions == 1);

    // A staged sum that is never committed changes nothing.
    agg.stage("grid", 100);
    CHECK(agg.state("grid").contributions == 1);
    CHECK(system.decrypt(agg.get_sum("grid")) == 9);
}

TEST_CASE("AggregatorRefusesOverflowingLoad") {
    const HEALSystem& system = test_system();
    Aggregator agg(system);

    agg.accumulate("grid", 400000);
    CHECK(error_kind_of([&] { agg.accumulate("grid", 400000); }) ==
          HEALErrorKind::INVALID_ARGUMENT);
    CHECK(agg.state("grid").contributions == 1);
    CHECK(agg.state("grid").plain_total == 400000);
    CHECK(system.decrypt(agg.get_sum("grid")) == 400000);

    // Exactly t - 1 still fits.
    agg.accumulate("grid", 386432);
    CHECK(agg.state("grid").plain_total == 786432);
    CHECK(system.decrypt(agg.get_sum("grid")) == 786432);
    CHECK(error_kind_of([&] { agg.accumulate("grid", 1); }) == HEALErrorKind::INVALID_ARGUMENT);

    // A single load at or past t never registers a key.
    CHECK(error_kind_of([&] { agg.accumulate("fresh", 786433); }) ==
          HEALErrorKind::INVALID_ARGUMENT);
    CHECK(!agg.contains("fresh"));
}

#include "test_util.h"

#include "heal/config.h"

#include <cstdlib>
#include <stdexcept>

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST_CASE("HEALConfigDefaults") {
    HEALConfig cfg;
    CHECK(cfg.data_dir == "data");
    CHECK(cfg.system_key == "central_system");
    CHECK(cfg.request_ttl == 3600);
    CHECK(!cfg.log_events);
    CHECK(cfg.threads == 1);

    CHECK(cfg.params_path() == "data/params.bin");
    CHECK(cfg.oracle_key_path() == "data/oracle_signing_key.bin");
    CHECK(cfg.audit_path() == "data/results/ledger_audit.csv");
    CHECK_NOTHROW(cfg.validate());
}

TEST_CASE("HEALConfigFromEnv") {
    ScopedEnv dir("HEAL_DATA_DIR", "/tmp/heal");
    ScopedEnv key("HEAL_SYSTEM_KEY", "substation_4");
    ScopedEnv ttl("HEAL_REQUEST_TTL", "90");
    ScopedEnv log("HEAL_LOG_EVENTS", "1");
    ScopedEnv threads("HEAL_THREADS", "4");

    HEALConfig cfg = HEALConfig::from_env();
    CHECK(cfg.data_dir == "/tmp/heal");
    CHECK(cfg.system_key == "substation_4");
    CHECK(cfg.request_ttl == 90);
    CHECK(cfg.log_events);
    CHECK(cfg.threads == 4);
    CHECK(cfg.context_path() == "/tmp/heal/cryptocontext.bin");
}

TEST_CASE("HEALConfigLogEventsOff") {
    ScopedEnv log("HEAL_LOG_EVENTS", "0");
    CHECK(!HEALConfig::from_env().log_events);
}

TEST_CASE("HEALConfigApplyArgs") {
    HEALConfig cfg;
    char prog[] = "heal_client";
    char a1[] = "--data-dir";
    char a2[] = "out";
    char a3[] = "--ttl";
    char a4[] = "15";
    char a5[] = "--log-events";
    char a6[] = "--system-key";
    char a7[] = "feeder";
    char a8[] = "5";
    char a9[] = "7";
    char* argv[] = {prog, a1, a2, a3, a4, a5, a6, a7, a8, a9};

    int first = cfg.apply_args(10, argv);
    CHECK(first == 8);
    CHECK(cfg.data_dir == "out");
    CHECK(cfg.request_ttl == 15);
    CHECK(cfg.log_events);
    CHECK(cfg.system_key == "feeder");
    CHECK(cfg.metrics_path() == "out/results/ledger_metrics.csv");
}

TEST_CASE("HEALConfigApplyArgsMissingValue") {
    HEALConfig cfg;
    char prog[] = "heal_ledgerd";
    char a1[] = "--threads";
    char* argv[] = {prog, a1};
    CHECK_THROWS_AS(cfg.apply_args(2, argv), std::runtime_error);
}

TEST_CASE("HEALConfigValidate") {
    HEALConfig cfg;

    SUBCASE("empty data dir") {
        cfg.data_dir = "";
        CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
    }
    SUBCASE("empty system key") {
        cfg.system_key = "";
        CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
    }
    SUBCASE("no threads") {
        cfg.threads = 0;
        CHECK_THROWS_AS(cfg.validate(), std::runtime_error);
    }
}

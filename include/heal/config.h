// config.h
#ifndef HEAL_CONFIG_H
#define HEAL_CONFIG_H

#include <cstdint>
#include <string>

static constexpr const char* kDefaultDataDir = "data";
static constexpr const char* kDefaultSystemKey = "central_system";
static constexpr uint64_t kDefaultRequestTtl = 3600;

/**
   HEALConfig. Runtime settings shared by the tools. Defaults, then HEAL_*
   environment variables, then --flags, each overriding the previous.

     HEAL_DATA_DIR      --data-dir     directory holding keys and results
     HEAL_SYSTEM_KEY    --system-key   accumulator for submissions without one
     HEAL_REQUEST_TTL   --ttl          seconds before EXPIRE drops a request
     HEAL_LOG_EVENTS    --log-events   echo ledger events to stderr
     HEAL_THREADS       --threads      OpenMP threads for OpenFHE
**/
struct HEALConfig {
    std::string data_dir = kDefaultDataDir;
    std::string system_key = kDefaultSystemKey;
    uint64_t request_ttl = kDefaultRequestTtl;
    bool log_events = false;
    int threads = 1;

    std::string params_path() const { return data_dir + "/params.bin"; }
    std::string context_path() const { return data_dir + "/cryptocontext.bin"; }
    std::string public_key_path() const { return data_dir + "/key_public.bin"; }
    std::string secret_key_path() const { return data_dir + "/key_secret.bin"; }
    std::string oracle_key_path() const { return data_dir + "/oracle_signing_key.bin"; }
    std::string results_dir() const { return data_dir + "/results"; }
    std::string metrics_path() const { return results_dir() + "/ledger_metrics.csv"; }
    std::string audit_path() const { return results_dir() + "/ledger_audit.csv"; }

    static HEALConfig from_env();

    // Consumes the flags it knows; returns the index of the first argument
    // that is not a flag.
    int apply_args(int argc, char** argv);

    void validate() const;
};

#endif

// config.cpp
#include "heal/config.h"
#include "common/key_files.h"

#include <cstdlib>
#include <stdexcept>

static bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v != nullptr && std::string(v) != "0" && std::string(v) != "";
}

HEALConfig HEALConfig::from_env() {
    HEALConfig cfg;

    if (const char* v = std::getenv("HEAL_DATA_DIR")) cfg.data_dir = v;
    if (const char* v = std::getenv("HEAL_SYSTEM_KEY")) cfg.system_key = v;
    if (const char* v = std::getenv("HEAL_REQUEST_TTL")) cfg.request_ttl = std::stoull(v);
    if (const char* v = std::getenv("HEAL_THREADS")) cfg.threads = std::stoi(v);
    cfg.log_events = env_flag("HEAL_LOG_EVENTS");

    return cfg;
}

int HEALConfig::apply_args(int argc, char** argv) {
    int i = 1;
    for (; i < argc; i++) {
        if (arg_eq(argv[i], "--data-dir")) {
            data_dir = read_str_flag(argc, argv, i);
        } else if (arg_eq(argv[i], "--system-key")) {
            system_key = read_str_flag(argc, argv, i);
        } else if (arg_eq(argv[i], "--ttl")) {
            request_ttl = read_u64_flag(argc, argv, i);
        } else if (arg_eq(argv[i], "--threads")) {
            threads = (int)read_u64_flag(argc, argv, i);
        } else if (arg_eq(argv[i], "--log-events")) {
            log_events = true;
        } else {
            break;
        }
    }
    return i;
}

void HEALConfig::validate() const {
    if (data_dir.empty()) throw std::runtime_error("data dir must not be empty");
    if (system_key.empty()) throw std::runtime_error("system key must not be empty");
    if (threads < 1) throw std::runtime_error("threads must be >= 1");
}

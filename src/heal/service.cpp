// service.cpp
#include "heal/service.h"
#include "heal/errors.h"

#include <stdexcept>

const char* to_string(RevealState state) {
    switch (state) {
    case RevealState::SEALED:
        return "SEALED";
    case RevealState::REQUESTED:
        return "REQUESTED";
    case RevealState::REVEALED:
        return "REVEALED";
    case RevealState::REJECTED:
        return "REJECTED";
    }
    return "UNKNOWN";
}

const char* to_string(SumState state) {
    switch (state) {
    case SumState::UNINITIALIZED:
        return "UNINITIALIZED";
    case SumState::ACCUMULATING:
        return "ACCUMULATING";
    case SumState::REQUESTED_SUM:
        return "REQUESTED_SUM";
    case SumState::SUM_REVEALED:
        return "SUM_REVEALED";
    }
    return "UNKNOWN";
}

LedgerService::LedgerService(HEALLedger& ledger, LocalDecryptionOracle& oracle,
                             const HEALSystem& system)
    : ledger(ledger), oracle(oracle), system(system) {}

// Decimal digits only; no sign, no trailing junk, no wraparound.
static bool parse_u64(const std::string& token, uint64_t& v) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        v = std::stoull(token);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static uint64_t next_u64(std::istringstream& args, const char* what) {
    std::string token;
    uint64_t v = 0;
    if (!(args >> token) || !parse_u64(token, v)) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, std::string("missing or bad ") + what);
    }
    return v;
}

static std::string next_word(std::istringstream& args, const char* what) {
    std::string w;
    if (!(args >> w)) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, std::string("missing ") + what);
    }
    return w;
}

static std::string optional_word(std::istringstream& args) {
    std::string w;
    args >> w;
    return w;
}

std::string LedgerService::dispatch(const std::string& cmd, std::istringstream& args) {
    std::ostringstream out;

    if (cmd == "QUIT") {
        quit = true;
        return "OK";
    }

    if (cmd == "SUBMIT") {
        uint64_t usage = next_u64(args, "usage");
        uint64_t timestamp = next_u64(args, "timestamp");
        uint64_t load = next_u64(args, "load");
        std::string tenant = optional_word(args);
        std::string system_key = optional_word(args);
        out << "OK " << ledger.submit_plain(usage, timestamp, load, tenant, system_key);
        return out.str();
    }

    if (cmd == "SUBMIT_CT") {
        std::string file = next_word(args, "file");
        std::string tenant = optional_word(args);
        std::string system_key = optional_word(args);
        out << "OK " << ledger.submit(system.load_reading(file), tenant, system_key);
        return out.str();
    }

    if (cmd == "REVEAL") {
        out << "OK " << ledger.request_reveal(next_u64(args, "id"));
        return out.str();
    }

    if (cmd == "REJECT") {
        uint64_t id = next_u64(args, "id");
        ledger.reject(id, optional_word(args));
        return "OK";
    }

    if (cmd == "LIST") {
        out << "OK";
        for (uint64_t id : ledger.submissions_of(optional_word(args))) out << " " << id;
        return out.str();
    }

    if (cmd == "REVEAL_SUM") {
        out << "OK " << ledger.request_sum_reveal(next_word(args, "system key"));
        return out.str();
    }

    if (cmd == "FULFILL") {
        FulfillReport report = oracle.fulfill();
        for (const auto& err : report.errors) {
            std::cerr << "fulfill: rejected " << err << std::endl;
        }
        out << "OK " << report.delivered << " " << report.rejected;
        return out.str();
    }

    if (cmd == "EXPIRE") {
        std::string token = optional_word(args);
        size_t n = 0;
        if (token.empty()) {
            n = ledger.expire_requests();
        } else {
            uint64_t max_age = 0;
            if (!parse_u64(token, max_age)) {
                throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "bad max age " + token);
            }
            n = ledger.expire_requests(max_age);
        }
        out << "OK " << n;
        return out.str();
    }

    if (cmd == "GET") {
        RevealRecord r = ledger.get(next_u64(args, "id"));
        out << "OK " << (r.revealed ? 1 : 0) << " " << r.usage << " " << r.load << " "
            << r.reading_timestamp;
        return out.str();
    }

    if (cmd == "STATE") {
        out << "OK " << to_string(ledger.reveal_state(next_u64(args, "id")));
        return out.str();
    }

    if (cmd == "SUM") {
        AggregateState st = ledger.get_aggregate(next_word(args, "system key"));
        out << "OK " << to_string(st.state) << " " << st.contributions << " "
            << st.revealed_sum << " " << system.serialized_size(st.sum);
        return out.str();
    }

    if (cmd == "KEYS") {
        out << "OK";
        for (const auto& key : ledger.system_keys()) out << " " << key;
        return out.str();
    }

    if (cmd == "STATS") {
        LedgerSummary s = ledger.summary();
        out << "OK submissions=" << s.submissions
            << " revealed=" << s.revealed
            << " rejected=" << s.rejected
            << " pending=" << s.pending_requests
            << " systems=" << s.system_keys
            << " usage=" << s.total_revealed_usage
            << " load=" << s.total_revealed_load;
        return out.str();
    }

    throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "unknown command " + cmd);
}

std::string LedgerService::handle(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
        return "ERR InvalidArgument empty command";
    }

    try {
        return dispatch(cmd, iss);
    } catch (const HEALError& e) {
        return std::string("ERR ") + to_string(e.kind()) + " " + e.what();
    } catch (const std::exception& e) {
        return std::string("ERR Error ") + e.what();
    }
}

void LedgerService::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (!quit && std::getline(in, line)) {
        if (line.empty()) continue;
        out << handle(line) << "\n" << std::flush;
    }
}

// test_util.h
#ifndef HEAL_TEST_UTIL_H
#define HEAL_TEST_UTIL_H

#include <doctest/doctest.h>

#include "heal/coordinator.h"
#include "heal/errors.h"
#include "heal/events.h"
#include "heal/heal.h"
#include "heal/oracle.h"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

inline std::ostream& operator<<(std::ostream& os, HEALErrorKind kind) {
    return os << to_string(kind);
}

namespace heal_test {

// Small ring, no security. Key generation is the slow part, so every test
// shares one keyed system.
inline const HEALSystem& test_system() {
    static const HEALSystem system = [] {
        HEALSystem s(HEALParams(1024, 786433, 1, HEStd_NotSet));
        s.generate_keys();
        return s;
    }();
    return system;
}

inline SigningKey test_signing_key(uint8_t seed = 0x5A) {
    SigningKey key{};
    for (size_t i = 0; i < key.size(); i++) {
        key[i] = static_cast<uint8_t>(seed + i);
    }
    return key;
}

// Runs fn and returns the kind of the HEALError it throws.
template <typename Fn>
HEALErrorKind error_kind_of(Fn&& fn) {
    try {
        fn();
    } catch (const HEALError& e) {
        return e.kind();
    }
    FAIL("expected a HEALError");
    return HEALErrorKind::SIZE;
}

// Seconds since epoch that only move when told to.
class ManualClock {
public:
    explicit ManualClock(uint64_t start = 1000) : now_(std::make_shared<uint64_t>(start)) {}

    LedgerClock fn() const {
        std::shared_ptr<uint64_t> now = now_;
        return [now] { return *now; };
    }

    uint64_t now() const { return *now_; }
    void advance(uint64_t seconds) { *now_ += seconds; }

private:
    std::shared_ptr<uint64_t> now_;
};

class RecordingSink : public EventSink {
public:
    void on_event(const LedgerEvent& event) override { events.push_back(event); }

    std::vector<LedgerEventType> types() const {
        std::vector<LedgerEventType> out;
        for (const auto& e : events) out.push_back(e.type);
        return out;
    }

    std::vector<LedgerEvent> events;
};

// Oracle whose request ids and delivery are driven by the test. Ids come from
// next_ids while it has any, then from a counter.
class ScriptedOracle : public DecryptionOracle {
public:
    struct Request {
        RequestId id;
        std::vector<CiphertextHandle> cts;
        DecryptionCallback callback;
    };

    explicit ScriptedOracle(const SigningKey& key) : key(key) {}

    RequestId request_decryption(const std::vector<CiphertextHandle>& cts,
                                 DecryptionCallback callback) override {
        RequestId id;
        if (!next_ids.empty()) {
            id = next_ids.front();
            next_ids.pop_front();
        } else {
            id = ++counter;
        }
        requests.push_back(Request{id, cts, std::move(callback)});
        return id;
    }

    bool check_signatures(RequestId request_id, const std::vector<uint64_t>& plaintexts,
                          const DecryptionProof& proof) const override {
        return compute_decryption_proof(key, request_id, plaintexts) == proof;
    }

    // Honest answer to requests[index], not yet delivered.
    DecryptionResponse respond(size_t index) const {
        const Request& req = requests.at(index);
        DecryptionResponse r;
        r.request_id = req.id;
        for (const auto& ct : req.cts) {
            r.plaintexts.push_back(test_system().decrypt(ct));
        }
        r.proof = compute_decryption_proof(key, r.request_id, r.plaintexts);
        r.callback = req.callback;
        return r;
    }

    DecryptionProof sign(RequestId request_id, const std::vector<uint64_t>& plaintexts) const {
        return compute_decryption_proof(key, request_id, plaintexts);
    }

    SigningKey key;
    std::deque<RequestId> next_ids;
    std::vector<Request> requests;
    RequestId counter = 100;
};

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("heal_test_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace heal_test

#endif

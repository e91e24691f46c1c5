// aggregator.cpp
#include "heal/aggregator.h"
#include "heal/errors.h"

#include <openssl/sha.h>

#include <stdexcept>
#include <utility>

KeyHash hash_system_key(const std::string& system_key) {
    KeyHash hash;
    SHA256(reinterpret_cast<const unsigned char*>(system_key.data()), system_key.size(),
           hash.data());
    return hash;
}

std::string to_hex(const KeyHash& hash) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (uint8_t b : hash) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Aggregator::Aggregator(const HEALSystem& system) : system(system) {}

CiphertextHandle Aggregator::stage(const std::string& system_key, uint64_t load) const {
    if (system_key.empty()) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "Empty system key");
    }

    auto it = states.find(system_key);
    if (it == states.end()) {
        auto h = key_by_hash.find(hash_system_key(system_key));
        if (h != key_by_hash.end() && h->second != system_key) {
            throw std::runtime_error("System key hash collision for " + system_key);
        }
    }

    const bool initialized = it != states.end() && it->second.initialized;
    const uint64_t total = initialized ? it->second.plain_total : 0;
    const uint64_t t = system.get_params().plain_modulus;
    // total < t always holds, so total + load cannot overflow once load < t.
    if (load >= t || total + load >= t) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT,
                        "Load " + std::to_string(load) + " would overflow the sum of " +
                        system_key + " (total " + std::to_string(total) +
                        ", plaintext modulus " + std::to_string(t) + ")");
    }

    CiphertextHandle base = initialized ? it->second.sum : system.encrypt_zero();

    return system.add(base, system.encrypt(load));
}

void Aggregator::commit(const std::string& system_key, CiphertextHandle new_sum,
                        uint64_t load) {
    auto it = states.find(system_key);
    if (it == states.end()) {
        KeyHash hash = hash_system_key(system_key);
        auto ins = key_by_hash.emplace(hash, system_key);
        if (!ins.second && ins.first->second != system_key) {
            throw std::runtime_error("System key hash collision for " + system_key);
        }
        it = states.emplace(system_key, AggregateState{}).first;
        keys.push_back(system_key);
    }

    AggregateState& s = it->second;
    s.sum = std::move(new_sum);
    s.initialized = true;
    s.plain_total += load;
    s.contributions++;
    if (s.state == SumState::UNINITIALIZED) {
        s.state = SumState::ACCUMULATING;
    }
}

void Aggregator::accumulate(const std::string& system_key, uint64_t load) {
    commit(system_key, stage(system_key, load), load);
}

const CiphertextHandle& Aggregator::get_sum(const std::string& system_key) const {
    return state(system_key).sum;
}

bool Aggregator::contains(const std::string& system_key) const {
    auto it = states.find(system_key);
    return it != states.end() && it->second.initialized;
}

const AggregateState& Aggregator::state(const std::string& system_key) const {
    auto it = states.find(system_key);
    if (it == states.end() || !it->second.initialized) {
        throw HEALError(HEALErrorKind::UNKNOWN_SYSTEM, "Unknown system " + system_key);
    }
    return it->second;
}

AggregateState& Aggregator::state(const std::string& system_key) {
    auto it = states.find(system_key);
    if (it == states.end() || !it->second.initialized) {
        throw HEALError(HEALErrorKind::UNKNOWN_SYSTEM, "Unknown system " + system_key);
    }
    return it->second;
}

const std::string& Aggregator::resolve(const KeyHash& hash) const {
    auto it = key_by_hash.find(hash);
    if (it == key_by_hash.end()) {
        throw HEALError(HEALErrorKind::UNKNOWN_SYSTEM, "Unknown system hash " + to_hex(hash));
    }
    return it->second;
}

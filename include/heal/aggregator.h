// aggregator.h
#ifndef HEAL_AGGREGATOR_H
#define HEAL_AGGREGATOR_H

#include "heal/heal.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

using KeyHash = std::array<uint8_t, 32>;

// SHA-256 of the system key string.
KeyHash hash_system_key(const std::string& system_key);
std::string to_hex(const KeyHash& hash);

// The key hash is already uniform; its first 8 bytes make a bucket index.
struct KeyHashHasher {
    size_t operator()(const KeyHash& h) const noexcept {
        size_t v = 0;
        std::memcpy(&v, h.data(), sizeof(v));
        return v;
    }
};

enum class SumState : uint8_t {
    UNINITIALIZED = 0,
    ACCUMULATING = 1,
    REQUESTED_SUM = 2,
    SUM_REVEALED = 3,
};

struct AggregateState {
    CiphertextHandle sum;
    bool initialized = false;
    uint64_t contributions = 0;
    // Plaintext total of the revealed loads in sum; kept below the plaintext
    // modulus so the ciphertext never wraps.
    uint64_t plain_total = 0;
    SumState state = SumState::UNINITIALIZED;

    // Last revealed snapshot. revealed_contributions tells how many loads the
    // snapshot covered.
    bool ever_revealed = false;
    uint64_t revealed_sum = 0;
    uint64_t revealed_contributions = 0;
    uint64_t revealed_at = 0;
    uint64_t contributions_at_request = 0;
};

/**
   Aggregator. Running homomorphic sums of revealed loads, one per system key.
   Keys register lazily on first contribution, exactly once. The sums are never
   decrypted here; reveals go through the decryption coordinator.
**/
class Aggregator {
public:
    explicit Aggregator(const HEALSystem& system);

    // New sum for key + load, computed without touching any state. Throws
    // InvalidArgument if the total would reach the plaintext modulus.
    CiphertextHandle stage(const std::string& system_key, uint64_t load) const;
    // Installs a sum staged for the same load and registers the key if unseen.
    void commit(const std::string& system_key, CiphertextHandle new_sum, uint64_t load);

    void accumulate(const std::string& system_key, uint64_t load);

    const CiphertextHandle& get_sum(const std::string& system_key) const;

    bool contains(const std::string& system_key) const;
    const AggregateState& state(const std::string& system_key) const;
    AggregateState& state(const std::string& system_key);

    // Registration order.
    const std::vector<std::string>& system_keys() const { return keys; }
    const std::string& resolve(const KeyHash& hash) const;

private:
    const HEALSystem& system;
    std::unordered_map<std::string, AggregateState> states;
    std::unordered_map<KeyHash, std::string, KeyHashHasher> key_by_hash;
    std::vector<std::string> keys;
};

#endif

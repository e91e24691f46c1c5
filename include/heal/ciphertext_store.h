// ciphertext_store.h
#ifndef HEAL_CIPHERTEXT_STORE_H
#define HEAL_CIPHERTEXT_STORE_H

#include "heal/heal.h"

#include <cstdint>
#include <string>
#include <vector>

struct Submission {
    uint64_t id = 0;
    EncryptedReading reading;
    // Unix seconds at acceptance.
    uint64_t accepted_at = 0;
    std::string tenant;
    // Accumulator the revealed load feeds into.
    std::string system_key;
};

/**
   CiphertextStore. Append-only store of encrypted submissions. Ids start at 1
   and are never reused; a submission's handles never change once stored.
**/
class CiphertextStore {
public:
    CiphertextStore() = default;

    uint64_t submit(EncryptedReading reading, uint64_t accepted_at,
                    std::string tenant, std::string system_key);

    const Submission& get(uint64_t id) const;

    bool contains(uint64_t id) const { return id != 0 && id <= submissions.size(); }
    uint64_t size() const { return submissions.size(); }
    std::vector<uint64_t> ids() const;
    // Submissions made by one tenant, in id order.
    std::vector<uint64_t> ids_of(const std::string& tenant) const;

private:
    // submissions[id - 1]
    std::vector<Submission> submissions;
};

#endif

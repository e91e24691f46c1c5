// ciphertext_store.cpp
#include "heal/ciphertext_store.h"
#include "heal/errors.h"

#include <numeric>
#include <utility>

uint64_t CiphertextStore::submit(EncryptedReading reading, uint64_t accepted_at,
                                 std::string tenant, std::string system_key) {
    if (!reading.usage || !reading.timestamp || !reading.load) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "Submission is missing a ciphertext");
    }

    Submission s;
    s.id = submissions.size() + 1;
    s.reading = std::move(reading);
    s.accepted_at = accepted_at;
    s.tenant = std::move(tenant);
    s.system_key = std::move(system_key);

    submissions.push_back(std::move(s));
    return submissions.back().id;
}

const Submission& CiphertextStore::get(uint64_t id) const {
    if (!contains(id)) {
        throw HEALError(HEALErrorKind::NOT_FOUND, "Unknown submission " + std::to_string(id));
    }
    return submissions[id - 1];
}

std::vector<uint64_t> CiphertextStore::ids() const {
    std::vector<uint64_t> out(submissions.size());
    std::iota(out.begin(), out.end(), 1);
    return out;
}

std::vector<uint64_t> CiphertextStore::ids_of(const std::string& tenant) const {
    std::vector<uint64_t> out;
    for (const auto& s : submissions) {
        if (s.tenant == tenant) out.push_back(s.id);
    }
    return out;
}

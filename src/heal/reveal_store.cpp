// reveal_store.cpp
#include "heal/reveal_store.h"
#include "heal/errors.h"

#include <string>

void RevealStore::open(uint64_t id) {
    if (!records.emplace(id, RevealRecord{}).second) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT,
                        "Reveal record " + std::to_string(id) + " already open");
    }
}

const RevealRecord& RevealStore::get(uint64_t id) const {
    auto it = records.find(id);
    if (it == records.end()) {
        throw HEALError(HEALErrorKind::NOT_FOUND, "Unknown submission " + std::to_string(id));
    }
    return it->second;
}

// Record that is still open for its single write.
RevealRecord& RevealStore::settle_(uint64_t id) {
    auto it = records.find(id);
    if (it == records.end()) {
        throw HEALError(HEALErrorKind::NOT_FOUND, "Unknown submission " + std::to_string(id));
    }

    RevealRecord& r = it->second;
    if (r.revealed) {
        throw HEALError(HEALErrorKind::ALREADY_REVEALED,
                        "Submission " + std::to_string(id) + " already revealed");
    }
    if (r.rejected) {
        throw HEALError(HEALErrorKind::ALREADY_REJECTED,
                        "Submission " + std::to_string(id) + " was rejected");
    }
    return r;
}

void RevealStore::reveal(uint64_t id, uint64_t usage, uint64_t load,
                         uint64_t reading_timestamp, uint64_t revealed_at) {
    RevealRecord& r = settle_(id);
    r.usage = usage;
    r.load = load;
    r.reading_timestamp = reading_timestamp;
    r.revealed_at = revealed_at;
    r.revealed = true;
    n_revealed++;
}

void RevealStore::reject(uint64_t id, uint64_t rejected_at) {
    RevealRecord& r = settle_(id);
    r.rejected = true;
    r.rejected_at = rejected_at;
    n_rejected++;
}

// reveal_store.h
#ifndef HEAL_REVEAL_STORE_H
#define HEAL_REVEAL_STORE_H

#include <cstddef>
#include <cstdint>
#include <unordered_map>

struct RevealRecord {
    uint64_t usage = 0;
    uint64_t load = 0;
    uint64_t reading_timestamp = 0;
    uint64_t revealed_at = 0;
    bool revealed = false;
    // Terminal: a rejected record is never revealed.
    bool rejected = false;
    uint64_t rejected_at = 0;
};

/**
   RevealStore. One record per submission, opened un-revealed at submit time.
   A record is either revealed or rejected, exactly once, and never reverts.
**/
class RevealStore {
public:
    void open(uint64_t id);

    const RevealRecord& get(uint64_t id) const;
    bool is_revealed(uint64_t id) const { return get(id).revealed; }

    void reveal(uint64_t id, uint64_t usage, uint64_t load,
                uint64_t reading_timestamp, uint64_t revealed_at);

    void reject(uint64_t id, uint64_t rejected_at);
    bool is_rejected(uint64_t id) const { return get(id).rejected; }

    size_t size() const { return records.size(); }
    size_t revealed_count() const { return n_revealed; }
    size_t rejected_count() const { return n_rejected; }

private:
    RevealRecord& settle_(uint64_t id);

    std::unordered_map<uint64_t, RevealRecord> records;
    size_t n_revealed = 0;
    size_t n_rejected = 0;
};

#endif

// coordinator.h
#ifndef HEAL_COORDINATOR_H
#define HEAL_COORDINATOR_H

#include "heal/aggregator.h"
#include "heal/ciphertext_store.h"
#include "heal/events.h"
#include "heal/oracle.h"
#include "heal/reveal_store.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using LedgerClock = std::function<uint64_t()>;

enum class RevealState : uint8_t {
    SEALED = 0,
    REQUESTED = 1,
    REVEALED = 2,
    REJECTED = 3,
};

/**
   PendingTarget. What a request id resolves to. Submission ids and system key
   hashes live in separate spaces: a request issued for one kind is never
   accepted by the callback of the other.
**/
struct PendingTarget {
    enum class Kind : uint8_t { SUBMISSION = 0, SYSTEM_SUM = 1 };

    Kind kind = Kind::SUBMISSION;
    uint64_t submission_id = 0;
    KeyHash key_hash{};
};

struct PendingRequest {
    PendingTarget target;
    uint64_t issued_at = 0;
    // Settled by a successful callback. Kept so duplicates report
    // AlreadyRevealed rather than UnknownRequest.
    bool consumed = false;
};

struct LedgerSummary {
    uint64_t submissions = 0;
    uint64_t revealed = 0;
    uint64_t rejected = 0;
    uint64_t pending_requests = 0;
    uint64_t system_keys = 0;
    uint64_t total_revealed_usage = 0;
    uint64_t total_revealed_load = 0;
};

/**
   DecryptionCoordinator. The reveal state machine.

   Submission: SEALED -> REQUESTED -> REVEALED, or SEALED -> REJECTED when
               the owning tenant withdraws it before any reveal.
   Aggregate:  UNINITIALIZED -> ACCUMULATING -> REQUESTED_SUM -> SUM_REVEALED,
               and back to REQUESTED_SUM on a fresh request.

   Every operation runs under one mutex, so issuing a request and recording
   its id are atomic with respect to callbacks. The coordinator is the only
   writer of reveal records and aggregate state.
**/
class DecryptionCoordinator {
public:
    DecryptionCoordinator(CiphertextStore& ciphertexts, RevealStore& reveals,
                          Aggregator& aggregator, DecryptionOracle& oracle,
                          LedgerClock clock);

    DecryptionCoordinator(const DecryptionCoordinator&) = delete;
    DecryptionCoordinator& operator=(const DecryptionCoordinator&) = delete;

    void add_sink(EventSink* sink);

    uint64_t admit(EncryptedReading reading, std::string tenant, std::string system_key);

    RequestId request_reveal(uint64_t id);
    void on_reveal_callback(RequestId request_id, const std::vector<uint64_t>& plaintexts,
                            const DecryptionProof& proof);

    // Permanently seals a submission. Only its tenant may do so, and only
    // while no decryption is in flight.
    void reject(uint64_t id, const std::string& tenant);

    RequestId request_sum_reveal(const std::string& system_key);
    void on_sum_reveal_callback(RequestId request_id, uint64_t plaintext_sum,
                                const DecryptionProof& proof);

    // Drops unsettled requests issued at least max_age seconds ago.
    size_t expire_requests(uint64_t max_age);

    RevealState reveal_state(uint64_t id) const;
    SumState sum_state(const std::string& system_key) const;
    size_t pending_count() const;
    // Request ids still mapped, settled ones included.
    size_t tracked_requests() const;

    Submission submission(uint64_t id) const;
    RevealRecord reveal_record(uint64_t id) const;
    std::vector<uint64_t> submissions_of(const std::string& tenant) const;
    CiphertextHandle sum(const std::string& system_key) const;
    AggregateState aggregate(const std::string& system_key) const;
    std::vector<std::string> system_keys() const;
    std::string resolve(const KeyHash& hash) const;
    LedgerSummary summary() const;

private:
    // expected_id / expected_hash pin the target the oracle callback was
    // issued for; 0 / nullptr when the caller is the public entry point.
    void settle_reveal(RequestId request_id, uint64_t expected_id,
                       const std::vector<uint64_t>& plaintexts, const DecryptionProof& proof);
    void settle_sum(RequestId request_id, const KeyHash* expected_hash,
                    const std::vector<uint64_t>& plaintexts, const DecryptionProof& proof);

    void record_pending(RequestId request_id, const PendingTarget& target, uint64_t now);
    void emit(LedgerEventType type, uint64_t id, const std::string& system_key,
              RequestId request_id, uint64_t now);

    CiphertextStore& ciphertexts;
    RevealStore& reveals;
    Aggregator& aggregator;
    DecryptionOracle& oracle;
    LedgerClock clock;

    std::vector<EventSink*> sinks;

    std::unordered_map<RequestId, PendingRequest> pending;
    std::unordered_map<uint64_t, RequestId> outstanding_by_id;
    std::unordered_map<KeyHash, RequestId, KeyHashHasher> outstanding_by_key;
    // Latest sum request per key, kept until the next one supersedes it.
    std::unordered_map<KeyHash, RequestId, KeyHashHasher> last_sum_by_key;

    mutable std::mutex mu_;
};

#endif

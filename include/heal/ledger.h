// ledger.h
#ifndef HEAL_LEDGER_H
#define HEAL_LEDGER_H

#include "heal/aggregator.h"
#include "heal/ciphertext_store.h"
#include "heal/config.h"
#include "heal/coordinator.h"
#include "heal/events.h"
#include "heal/oracle.h"
#include "heal/reveal_store.h"
#include "common/metrics_stats_csv.h"

#include <cstdint>
#include <string>
#include <vector>

uint64_t unix_time_s();

/**
   HEALLedger. The service object behind every transport. Owns the ciphertext
   store, reveal store, aggregator and decryption coordinator; borrows the HE
   system and the oracle, which must outlive it.

   Tenants call submit / request_reveal / reject / request_sum_reveal and the
   queries.
   The two callbacks are for the oracle only.
**/
class HEALLedger {
public:
    HEALLedger(const HEALSystem& system, DecryptionOracle& oracle, HEALConfig config,
               LedgerClock clock = unix_time_s);

    HEALLedger(const HEALLedger&) = delete;
    HEALLedger& operator=(const HEALLedger&) = delete;

    void add_sink(EventSink* sink) { coordinator.add_sink(sink); }
    void set_metrics(StatsCsvSink* sink) { metrics = sink; }

    bool is_available() const { return system.can_encrypt(); }
    const HEALConfig& get_config() const { return config; }

    // Empty system_key selects the configured default.
    uint64_t submit(EncryptedReading reading, const std::string& tenant = "",
                    const std::string& system_key = "");
    // Encrypts under the ledger's public key on the tenant's behalf.
    uint64_t submit_plain(uint64_t usage, uint64_t timestamp, uint64_t load,
                          const std::string& tenant = "", const std::string& system_key = "");

    RequestId request_reveal(uint64_t id);
    void on_reveal_callback(RequestId request_id, const std::vector<uint64_t>& plaintexts,
                            const DecryptionProof& proof);

    void reject(uint64_t id, const std::string& tenant);

    RequestId request_sum_reveal(const std::string& system_key);
    void on_sum_reveal_callback(RequestId request_id, uint64_t plaintext_sum,
                                const DecryptionProof& proof);

    // Uses the configured request TTL.
    size_t expire_requests() { return expire_requests(config.request_ttl); }
    size_t expire_requests(uint64_t max_age);

    RevealRecord get(uint64_t id) const { return coordinator.reveal_record(id); }
    Submission get_submission(uint64_t id) const { return coordinator.submission(id); }
    CiphertextHandle get_sum(const std::string& system_key) const { return coordinator.sum(system_key); }
    AggregateState get_aggregate(const std::string& system_key) const { return coordinator.aggregate(system_key); }
    std::vector<std::string> system_keys() const { return coordinator.system_keys(); }
    std::vector<uint64_t> submissions_of(const std::string& tenant) const { return coordinator.submissions_of(tenant); }
    std::string resolve_system_key(const KeyHash& hash) const { return coordinator.resolve(hash); }

    RevealState reveal_state(uint64_t id) const { return coordinator.reveal_state(id); }
    SumState sum_state(const std::string& system_key) const { return coordinator.sum_state(system_key); }
    size_t pending_count() const { return coordinator.pending_count(); }
    size_t tracked_requests() const { return coordinator.tracked_requests(); }
    LedgerSummary summary() const { return coordinator.summary(); }

private:
    const HEALSystem& system;
    HEALConfig config;

    CiphertextStore ciphertexts;
    RevealStore reveals;
    Aggregator aggregator;
    DecryptionCoordinator coordinator;

    StatsCsvSink* metrics = nullptr;
};

#endif

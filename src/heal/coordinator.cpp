// coordinator.cpp
#include "heal/coordinator.h"
#include "heal/errors.h"

#include <utility>

DecryptionCoordinator::DecryptionCoordinator(CiphertextStore& ciphertexts, RevealStore& reveals,
                                             Aggregator& aggregator, DecryptionOracle& oracle,
                                             LedgerClock clock)
    : ciphertexts(ciphertexts), reveals(reveals), aggregator(aggregator), oracle(oracle),
      clock(std::move(clock)) {}

void DecryptionCoordinator::add_sink(EventSink* sink) {
    std::lock_guard<std::mutex> lk(mu_);
    if (sink) sinks.push_back(sink);
}

void DecryptionCoordinator::emit(LedgerEventType type, uint64_t id,
                                 const std::string& system_key, RequestId request_id,
                                 uint64_t now) {
    LedgerEvent e;
    e.type = type;
    e.id = id;
    e.system_key = system_key;
    e.timestamp = now;
    e.request_id = request_id;

    for (EventSink* sink : sinks) {
        sink->on_event(e);
    }
}

void DecryptionCoordinator::record_pending(RequestId request_id, const PendingTarget& target,
                                           uint64_t now) {
    PendingRequest req;
    req.target = target;
    req.issued_at = now;

    if (!pending.emplace(request_id, req).second) {
        throw HEALError(HEALErrorKind::REQUEST_COLLISION,
                        "Request id " + std::to_string(request_id) + " is already mapped");
    }
}

uint64_t DecryptionCoordinator::admit(EncryptedReading reading, std::string tenant,
                                      std::string system_key) {
    if (system_key.empty()) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "Empty system key");
    }

    std::lock_guard<std::mutex> lk(mu_);
    uint64_t now = clock();

    uint64_t id = ciphertexts.submit(std::move(reading), now, std::move(tenant),
                                     std::move(system_key));
    reveals.open(id);

    emit(LedgerEventType::SUBMISSION_ACCEPTED, id, "", 0, now);
    return id;
}

RequestId DecryptionCoordinator::request_reveal(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);

    const Submission& s = ciphertexts.get(id);
    if (reveals.is_revealed(id)) {
        throw HEALError(HEALErrorKind::ALREADY_REVEALED,
                        "Submission " + std::to_string(id) + " already revealed");
    }
    if (reveals.is_rejected(id)) {
        throw HEALError(HEALErrorKind::ALREADY_REJECTED,
                        "Submission " + std::to_string(id) + " was rejected");
    }
    if (outstanding_by_id.count(id)) {
        throw HEALError(HEALErrorKind::ALREADY_REQUESTED,
                        "Submission " + std::to_string(id) + " has a decryption in flight");
    }

    uint64_t now = clock();

    std::vector<CiphertextHandle> cts{s.reading.usage, s.reading.timestamp, s.reading.load};
    RequestId request_id = oracle.request_decryption(
        cts,
        [this, id](RequestId rid, const std::vector<uint64_t>& plaintexts,
                   const DecryptionProof& proof) {
            settle_reveal(rid, id, plaintexts, proof);
        });

    PendingTarget target;
    target.kind = PendingTarget::Kind::SUBMISSION;
    target.submission_id = id;
    record_pending(request_id, target, now);
    outstanding_by_id[id] = request_id;

    emit(LedgerEventType::DECRYPTION_REQUESTED, id, "", request_id, now);
    return request_id;
}

void DecryptionCoordinator::on_reveal_callback(RequestId request_id,
                                               const std::vector<uint64_t>& plaintexts,
                                               const DecryptionProof& proof) {
    settle_reveal(request_id, 0, plaintexts, proof);
}

void DecryptionCoordinator::settle_reveal(RequestId request_id, uint64_t expected_id,
                                          const std::vector<uint64_t>& plaintexts,
                                          const DecryptionProof& proof) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = pending.find(request_id);
    if (it == pending.end() || it->second.target.kind != PendingTarget::Kind::SUBMISSION ||
        (expected_id != 0 && it->second.target.submission_id != expected_id)) {
        throw HEALError(HEALErrorKind::UNKNOWN_REQUEST,
                        "No reveal request " + std::to_string(request_id));
    }

    PendingRequest& req = it->second;
    const uint64_t id = req.target.submission_id;

    if (req.consumed || reveals.is_revealed(id)) {
        throw HEALError(HEALErrorKind::ALREADY_REVEALED,
                        "Submission " + std::to_string(id) + " already revealed");
    }
    if (!oracle.check_signatures(request_id, plaintexts, proof)) {
        throw HEALError(HEALErrorKind::INVALID_PROOF,
                        "Proof rejected for request " + std::to_string(request_id));
    }
    if (plaintexts.size() != 3) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT,
                        "Expected 3 plaintexts, got " + std::to_string(plaintexts.size()));
    }

    const uint64_t usage = plaintexts[0];
    const uint64_t reading_ts = plaintexts[1];
    const uint64_t load = plaintexts[2];

    // Everything that can fail happens before the first write.
    const Submission& s = ciphertexts.get(id);
    CiphertextHandle staged = aggregator.stage(s.system_key, load);
    uint64_t now = clock();

    reveals.reveal(id, usage, load, reading_ts, now);
    aggregator.commit(s.system_key, std::move(staged), load);
    req.consumed = true;
    outstanding_by_id.erase(id);

    emit(LedgerEventType::DATA_REVEALED, id, "", request_id, now);
}

void DecryptionCoordinator::reject(uint64_t id, const std::string& tenant) {
    std::lock_guard<std::mutex> lk(mu_);

    const Submission& s = ciphertexts.get(id);
    if (s.tenant != tenant) {
        throw HEALError(HEALErrorKind::NOT_TENANT,
                        "Submission " + std::to_string(id) + " is not owned by " + tenant);
    }
    if (outstanding_by_id.count(id)) {
        throw HEALError(HEALErrorKind::ALREADY_REQUESTED,
                        "Submission " + std::to_string(id) + " has a decryption in flight");
    }

    uint64_t now = clock();
    reveals.reject(id, now);

    emit(LedgerEventType::SUBMISSION_REJECTED, id, "", 0, now);
}

RequestId DecryptionCoordinator::request_sum_reveal(const std::string& system_key) {
    std::lock_guard<std::mutex> lk(mu_);

    AggregateState& st = aggregator.state(system_key);
    if (st.state == SumState::REQUESTED_SUM) {
        throw HEALError(HEALErrorKind::ALREADY_REQUESTED,
                        "Sum of " + system_key + " has a decryption in flight");
    }

    uint64_t now = clock();
    KeyHash hash = hash_system_key(system_key);

    RequestId request_id = oracle.request_decryption(
        std::vector<CiphertextHandle>{st.sum},
        [this, hash](RequestId rid, const std::vector<uint64_t>& plaintexts,
                     const DecryptionProof& proof) {
            settle_sum(rid, &hash, plaintexts, proof);
        });

    PendingTarget target;
    target.kind = PendingTarget::Kind::SYSTEM_SUM;
    target.key_hash = hash;
    record_pending(request_id, target, now);
    outstanding_by_key[hash] = request_id;

    auto last = last_sum_by_key.find(hash);
    if (last != last_sum_by_key.end()) {
        auto old = pending.find(last->second);
        if (old != pending.end() && old->second.consumed) pending.erase(old);
    }
    last_sum_by_key[hash] = request_id;

    st.state = SumState::REQUESTED_SUM;
    st.contributions_at_request = st.contributions;

    emit(LedgerEventType::SUM_DECRYPTION_REQUESTED, 0, system_key, request_id, now);
    return request_id;
}

void DecryptionCoordinator::on_sum_reveal_callback(RequestId request_id, uint64_t plaintext_sum,
                                                   const DecryptionProof& proof) {
    settle_sum(request_id, nullptr, std::vector<uint64_t>{plaintext_sum}, proof);
}

void DecryptionCoordinator::settle_sum(RequestId request_id, const KeyHash* expected_hash,
                                       const std::vector<uint64_t>& plaintexts,
                                       const DecryptionProof& proof) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = pending.find(request_id);
    if (it == pending.end() || it->second.target.kind != PendingTarget::Kind::SYSTEM_SUM ||
        (expected_hash && it->second.target.key_hash != *expected_hash)) {
        throw HEALError(HEALErrorKind::UNKNOWN_REQUEST,
                        "No sum request " + std::to_string(request_id));
    }

    PendingRequest& req = it->second;
    if (req.consumed) {
        throw HEALError(HEALErrorKind::ALREADY_REVEALED,
                        "Sum request " + std::to_string(request_id) + " already settled");
    }
    if (!oracle.check_signatures(request_id, plaintexts, proof)) {
        throw HEALError(HEALErrorKind::INVALID_PROOF,
                        "Proof rejected for request " + std::to_string(request_id));
    }
    if (plaintexts.size() != 1) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT,
                        "Expected 1 plaintext, got " + std::to_string(plaintexts.size()));
    }

    const std::string& system_key = aggregator.resolve(req.target.key_hash);
    AggregateState& st = aggregator.state(system_key);
    uint64_t now = clock();

    st.revealed_sum = plaintexts[0];
    st.revealed_contributions = st.contributions_at_request;
    st.revealed_at = now;
    st.ever_revealed = true;
    st.state = SumState::SUM_REVEALED;
    req.consumed = true;
    outstanding_by_key.erase(req.target.key_hash);

    emit(LedgerEventType::SUM_REVEALED, 0, system_key, request_id, now);
}

size_t DecryptionCoordinator::expire_requests(uint64_t max_age) {
    std::lock_guard<std::mutex> lk(mu_);
    uint64_t now = clock();
    size_t n_expired = 0;

    for (auto it = pending.begin(); it != pending.end();) {
        const RequestId request_id = it->first;
        const PendingRequest& req = it->second;

        if (req.consumed || now < req.issued_at || now - req.issued_at < max_age) {
            ++it;
            continue;
        }

        if (req.target.kind == PendingTarget::Kind::SUBMISSION) {
            outstanding_by_id.erase(req.target.submission_id);
            emit(LedgerEventType::DECRYPTION_EXPIRED, req.target.submission_id, "",
                 request_id, now);
        } else {
            const std::string& system_key = aggregator.resolve(req.target.key_hash);
            AggregateState& st = aggregator.state(system_key);
            st.state = st.ever_revealed ? SumState::SUM_REVEALED : SumState::ACCUMULATING;
            outstanding_by_key.erase(req.target.key_hash);
            emit(LedgerEventType::DECRYPTION_EXPIRED, 0, system_key, request_id, now);
        }

        it = pending.erase(it);
        n_expired++;
    }

    return n_expired;
}

RevealState DecryptionCoordinator::reveal_state(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (reveals.is_revealed(id)) return RevealState::REVEALED;
    if (reveals.is_rejected(id)) return RevealState::REJECTED;
    if (outstanding_by_id.count(id)) return RevealState::REQUESTED;
    return RevealState::SEALED;
}

SumState DecryptionCoordinator::sum_state(const std::string& system_key) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!aggregator.contains(system_key)) return SumState::UNINITIALIZED;
    return aggregator.state(system_key).state;
}

size_t DecryptionCoordinator::pending_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return outstanding_by_id.size() + outstanding_by_key.size();
}

size_t DecryptionCoordinator::tracked_requests() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending.size();
}

Submission DecryptionCoordinator::submission(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return ciphertexts.get(id);
}

RevealRecord DecryptionCoordinator::reveal_record(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return reveals.get(id);
}

std::vector<uint64_t> DecryptionCoordinator::submissions_of(const std::string& tenant) const {
    std::lock_guard<std::mutex> lk(mu_);
    return ciphertexts.ids_of(tenant);
}

CiphertextHandle DecryptionCoordinator::sum(const std::string& system_key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return aggregator.get_sum(system_key);
}

AggregateState DecryptionCoordinator::aggregate(const std::string& system_key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return aggregator.state(system_key);
}

std::vector<std::string> DecryptionCoordinator::system_keys() const {
    std::lock_guard<std::mutex> lk(mu_);
    return aggregator.system_keys();
}

std::string DecryptionCoordinator::resolve(const KeyHash& hash) const {
    std::lock_guard<std::mutex> lk(mu_);
    return aggregator.resolve(hash);
}

LedgerSummary DecryptionCoordinator::summary() const {
    std::lock_guard<std::mutex> lk(mu_);

    LedgerSummary s;
    s.submissions = ciphertexts.size();
    s.revealed = reveals.revealed_count();
    s.rejected = reveals.rejected_count();
    s.pending_requests = outstanding_by_id.size() + outstanding_by_key.size();
    s.system_keys = aggregator.system_keys().size();

    for (uint64_t id : ciphertexts.ids()) {
        const RevealRecord& r = reveals.get(id);
        if (!r.revealed) continue;
        s.total_revealed_usage += r.usage;
        s.total_revealed_load += r.load;
    }

    return s;
}

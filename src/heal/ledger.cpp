// ledger.cpp
#include "heal/ledger.h"
#include "heal/errors.h"

#include <chrono>
#include <exception>
#include <memory>
#include <utility>

uint64_t unix_time_s() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Times fn into the metrics sink, if one is attached, labelling ledger
// rejections with their error kind and any other failure as "Error".
template <typename Fn>
static auto timed(StatsCsvSink* metrics, const char* op, Fn&& fn) -> decltype(fn()) {
    std::unique_ptr<StatsScopeTimer> t;
    if (metrics) {
        t = std::make_unique<StatsScopeTimer>(*metrics, "ledger", op);
    }
    try {
        return fn();
    } catch (const HEALError& e) {
        if (t) t->fail(to_string(e.kind()));
        throw;
    } catch (const std::exception&) {
        if (t) t->fail("Error");
        throw;
    }
}

HEALLedger::HEALLedger(const HEALSystem& system, DecryptionOracle& oracle, HEALConfig config,
                       LedgerClock clock)
    : system(system),
      config(std::move(config)),
      aggregator(system),
      coordinator(ciphertexts, reveals, aggregator, oracle, std::move(clock)) {
    this->config.validate();
}

uint64_t HEALLedger::submit(EncryptedReading reading, const std::string& tenant,
                            const std::string& system_key) {
    return timed(metrics, "submit", [&] {
        return coordinator.admit(std::move(reading), tenant,
                                 system_key.empty() ? config.system_key : system_key);
    });
}

uint64_t HEALLedger::submit_plain(uint64_t usage, uint64_t timestamp, uint64_t load,
                                  const std::string& tenant, const std::string& system_key) {
    EncryptedReading reading = timed(metrics, "encrypt_reading", [&] {
        return system.encrypt_reading(usage, timestamp, load);
    });
    return submit(std::move(reading), tenant, system_key);
}

RequestId HEALLedger::request_reveal(uint64_t id) {
    return timed(metrics, "request_reveal", [&] { return coordinator.request_reveal(id); });
}

void HEALLedger::on_reveal_callback(RequestId request_id, const std::vector<uint64_t>& plaintexts,
                                    const DecryptionProof& proof) {
    timed(metrics, "reveal_callback", [&] {
        coordinator.on_reveal_callback(request_id, plaintexts, proof);
    });
}

void HEALLedger::reject(uint64_t id, const std::string& tenant) {
    timed(metrics, "reject", [&] { coordinator.reject(id, tenant); });
}

RequestId HEALLedger::request_sum_reveal(const std::string& system_key) {
    return timed(metrics, "request_sum_reveal", [&] {
        return coordinator.request_sum_reveal(system_key);
    });
}

void HEALLedger::on_sum_reveal_callback(RequestId request_id, uint64_t plaintext_sum,
                                        const DecryptionProof& proof) {
    timed(metrics, "sum_reveal_callback", [&] {
        coordinator.on_sum_reveal_callback(request_id, plaintext_sum, proof);
    });
}

size_t HEALLedger::expire_requests(uint64_t max_age) {
    return timed(metrics, "expire_requests", [&] { return coordinator.expire_requests(max_age); });
}

// oracle.h
#ifndef HEAL_ORACLE_H
#define HEAL_ORACLE_H

#include "heal/heal.h"

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

using RequestId = uint64_t;
using DecryptionProof = std::array<uint8_t, 32>;
using SigningKey = std::array<uint8_t, 32>;

using DecryptionCallback = std::function<void(RequestId,
                                              const std::vector<uint64_t>&,
                                              const DecryptionProof&)>;

/**
   DecryptionOracle. The external party that turns ciphertexts into plaintexts.

   request_decryption must return before the callback can run: implementations
   answer later, from another thread or from an explicit delivery step, never
   from inside request_decryption itself.
**/
class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    virtual RequestId request_decryption(const std::vector<CiphertextHandle>& cts,
                                         DecryptionCallback callback) = 0;

    virtual bool check_signatures(RequestId request_id,
                                  const std::vector<uint64_t>& plaintexts,
                                  const DecryptionProof& proof) const = 0;
};

// HMAC-SHA256(key, "HEAL-DECRYPTION" || request_id || n || plaintexts...),
// integers little-endian, n and plaintexts as 8 bytes each.
DecryptionProof compute_decryption_proof(const SigningKey& key, RequestId request_id,
                                         const std::vector<uint64_t>& plaintexts);

struct DecryptionResponse {
    RequestId request_id = 0;
    std::vector<uint64_t> plaintexts;
    DecryptionProof proof{};
    DecryptionCallback callback;
};

struct FulfillReport {
    size_t delivered = 0;
    size_t rejected = 0;
    std::vector<std::string> errors;
};

/**
   LocalDecryptionOracle. In-process trusted decryptor holding the secret key.
   Requests queue up until process() or fulfill() is called. Request ids count
   up from a random nonzero start, so none is issued twice.
**/
class LocalDecryptionOracle : public DecryptionOracle {
public:
    LocalDecryptionOracle(const HEALSystem& system, const SigningKey& signing_key);

    RequestId request_decryption(const std::vector<CiphertextHandle>& cts,
                                 DecryptionCallback callback) override;

    bool check_signatures(RequestId request_id,
                          const std::vector<uint64_t>& plaintexts,
                          const DecryptionProof& proof) const override;

    size_t queued() const;

    // Decrypts and signs every queued request without delivering. A request
    // that fails to decrypt is dropped alone, its error appended to failures.
    std::vector<DecryptionResponse> process(std::vector<std::string>* failures = nullptr);

    static void deliver(const DecryptionResponse& response);

    // process() then deliver() each. Decryption failures and callback errors
    // are counted as rejected, one response at a time.
    FulfillReport fulfill();

private:
    struct QueuedRequest {
        RequestId id;
        std::vector<CiphertextHandle> cts;
        DecryptionCallback callback;
    };

    RequestId fresh_request_id();

    const HEALSystem& system;
    SigningKey signing_key;

    mutable std::mutex mu_;
    std::deque<QueuedRequest> queue_;
    RequestId next_id_ = 0;
};

#endif

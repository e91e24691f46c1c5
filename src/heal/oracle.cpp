// oracle.cpp
#include "heal/oracle.h"
#include "heal/errors.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

static void append_u64_le(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

DecryptionProof compute_decryption_proof(const SigningKey& key, RequestId request_id,
                                         const std::vector<uint64_t>& plaintexts) {
    static const char* label = "HEAL-DECRYPTION"; // 15 bytes

    std::vector<uint8_t> msg(label, label + std::strlen(label));
    append_u64_le(msg, request_id);
    append_u64_le(msg, plaintexts.size());
    for (uint64_t p : plaintexts) {
        append_u64_le(msg, p);
    }

    unsigned int out_len = 0;
    DecryptionProof proof{};

    if (!HMAC(EVP_sha256(), key.data(), (int)key.size(), msg.data(), msg.size(),
              proof.data(), &out_len)) {
        throw std::runtime_error("HMAC failed");
    }
    if (out_len != proof.size()) throw std::runtime_error("HMAC output has unexpected size");

    return proof;
}

LocalDecryptionOracle::LocalDecryptionOracle(const HEALSystem& system,
                                             const SigningKey& signing_key)
    : system(system), signing_key(signing_key) {
    if (!system.can_decrypt()) {
        throw std::runtime_error("Decryption oracle needs a secret key");
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&next_id_), (int)sizeof(next_id_)) != 1) {
        throw std::runtime_error("RAND_bytes failed (request id)");
    }
}

RequestId LocalDecryptionOracle::fresh_request_id() {
    if (++next_id_ == 0) ++next_id_;
    return next_id_;
}

RequestId LocalDecryptionOracle::request_decryption(const std::vector<CiphertextHandle>& cts,
                                                    DecryptionCallback callback) {
    if (cts.empty()) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "Nothing to decrypt");
    }
    if (!callback) {
        throw HEALError(HEALErrorKind::INVALID_ARGUMENT, "Missing decryption callback");
    }

    std::lock_guard<std::mutex> lk(mu_);
    RequestId id = fresh_request_id();
    queue_.push_back(QueuedRequest{id, cts, std::move(callback)});
    return id;
}

bool LocalDecryptionOracle::check_signatures(RequestId request_id,
                                             const std::vector<uint64_t>& plaintexts,
                                             const DecryptionProof& proof) const {
    DecryptionProof expected = compute_decryption_proof(signing_key, request_id, plaintexts);
    return CRYPTO_memcmp(expected.data(), proof.data(), proof.size()) == 0;
}

size_t LocalDecryptionOracle::queued() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

std::vector<DecryptionResponse> LocalDecryptionOracle::process(std::vector<std::string>* failures) {
    std::deque<QueuedRequest> batch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        batch.swap(queue_);
    }

    std::vector<DecryptionResponse> out;
    out.reserve(batch.size());

    for (auto& req : batch) {
        DecryptionResponse r;
        r.request_id = req.id;
        try {
            r.plaintexts.reserve(req.cts.size());
            for (const auto& ct : req.cts) {
                r.plaintexts.push_back(system.decrypt(ct));
            }
            r.proof = compute_decryption_proof(signing_key, r.request_id, r.plaintexts);
        } catch (const std::exception& e) {
            if (failures) {
                failures->push_back("request " + std::to_string(req.id) + ": " + e.what());
            }
            continue;
        }
        r.callback = std::move(req.callback);
        out.push_back(std::move(r));
    }

    return out;
}

void LocalDecryptionOracle::deliver(const DecryptionResponse& response) {
    response.callback(response.request_id, response.plaintexts, response.proof);
}

FulfillReport LocalDecryptionOracle::fulfill() {
    FulfillReport report;

    std::vector<std::string> failures;
    std::vector<DecryptionResponse> responses = process(&failures);
    for (const auto& f : failures) {
        report.rejected++;
        report.errors.push_back("DecryptionFailed " + f);
    }

    for (const auto& r : responses) {
        try {
            deliver(r);
            report.delivered++;
        } catch (const HEALError& e) {
            report.rejected++;
            report.errors.push_back(std::string(to_string(e.kind())) + " " + e.what());
        } catch (const std::exception& e) {
            report.rejected++;
            report.errors.push_back(std::string("Error ") + e.what());
        }
    }

    return report;
}

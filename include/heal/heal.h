// heal.h
#ifndef HEAL_H
#define HEAL_H

#include "pke/openfhe.h"
#include <vector>
#include <memory>
#include <cstdint>
#include <string>

using namespace lbcrypto;
using namespace std;

using CiphertextHandle = Ciphertext<DCRTPoly>;

// Values are packed into the first slots as 16-bit limbs, least significant
// first, so 64-bit timestamps survive a small plaintext modulus.
static constexpr uint32_t kLimbBits = 16;
static constexpr size_t kLimbCount = 4;

struct EncryptedReading {
    CiphertextHandle usage;
    CiphertextHandle timestamp;
    CiphertextHandle load;
};

class HEALParams {
public:
    uint32_t ring_dim;
    uint64_t plain_modulus;
    uint32_t mult_depth;
    SecurityLevel sec_level;

    HEALParams(uint32_t N = 8192, uint64_t t = 786433, uint32_t depth = 1,
               SecurityLevel sec = HEStd_128_classic);

    bool validate_parameters() const;

    void save(const string& filename) const;
    static HEALParams load(const string& filename);
};

class HEALSystem {
private:
    HEALParams params;
    CryptoContext<DCRTPoly> context;
    PublicKey<DCRTPoly> public_key;
    PrivateKey<DCRTPoly> secret_key;

    Plaintext encode_limbs(uint64_t value) const;

public:
    explicit HEALSystem(HEALParams p);

    void generate_keys();

    bool can_encrypt() const { return public_key != nullptr; }
    bool can_decrypt() const { return secret_key != nullptr; }

    // Single-slot encoding; value must stay below the plaintext modulus.
    CiphertextHandle encrypt(uint64_t value) const;
    CiphertextHandle encrypt_zero() const;
    CiphertextHandle encrypt_timestamp(uint64_t timestamp) const;
    EncryptedReading encrypt_reading(uint64_t usage, uint64_t timestamp, uint64_t load) const;

    CiphertextHandle add(const CiphertextHandle& a, const CiphertextHandle& b) const;

    uint64_t decrypt(const CiphertextHandle& ct) const;

    CryptoContext<DCRTPoly> get_context() const { return context; }
    const HEALParams& get_params() const { return params; }

    void save_context(const string& filename) const;
    void load_context(const string& filename);

    void save_public_key(const string& filename) const;
    void load_public_key(const string& filename);
    void save_secret_key(const string& filename) const;
    void load_secret_key(const string& filename);

    void save_reading(const EncryptedReading& reading, const string& filename) const;
    EncryptedReading load_reading(const string& filename) const;

    size_t serialized_size(const CiphertextHandle& ct) const;
};

#endif

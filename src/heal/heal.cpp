// heal.cpp
#include "heal/heal.h"

#include "pke/cryptocontext-ser.h"
#include "pke/ciphertext-ser.h"
#include "pke/key/key-ser.h"
#include "pke/scheme/bfvrns/bfvrns-ser.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

HEALParams::HEALParams(uint32_t N, uint64_t t, uint32_t depth, SecurityLevel sec)
    : ring_dim(N), plain_modulus(t), mult_depth(depth), sec_level(sec) {}

bool HEALParams::validate_parameters() const {
    if (ring_dim == 0 || (ring_dim & (ring_dim - 1)) != 0) {
        throw std::runtime_error("Ring dimension must be a power of two");
    }

    if (plain_modulus < 2) {
        throw std::runtime_error("Plaintext modulus must be at least 2");
    }

    // Packed encoding needs t = 1 mod 2N.
    if ((plain_modulus - 1) % (2 * static_cast<uint64_t>(ring_dim)) != 0) {
        throw std::runtime_error(
            "Plaintext modulus " + std::to_string(plain_modulus) +
            " does not support packing at ring dimension " + std::to_string(ring_dim)
        );
    }

    if (static_cast<size_t>(ring_dim) < kLimbCount) {
        throw std::runtime_error("Ring dimension too small for limb encoding");
    }

    return true;
}

void HEALParams::save(const string& filename) const {
    ofstream out(filename, ios::binary);
    if (!out) {
        throw runtime_error("Failed to open " + filename);
    }
    out.write(reinterpret_cast<const char*>(&ring_dim), sizeof(ring_dim));
    out.write(reinterpret_cast<const char*>(&plain_modulus), sizeof(plain_modulus));
    out.write(reinterpret_cast<const char*>(&mult_depth), sizeof(mult_depth));
    out.write(reinterpret_cast<const char*>(&sec_level), sizeof(sec_level));
    out.close();
}

HEALParams HEALParams::load(const string& filename) {
    ifstream in(filename, ios::binary);
    if (!in) {
        throw runtime_error("Failed to open " + filename);
    }

    uint32_t N, depth;
    uint64_t t;
    SecurityLevel sec;

    in.read(reinterpret_cast<char*>(&N), sizeof(N));
    in.read(reinterpret_cast<char*>(&t), sizeof(t));
    in.read(reinterpret_cast<char*>(&depth), sizeof(depth));
    in.read(reinterpret_cast<char*>(&sec), sizeof(sec));
    if (!in) {
        throw runtime_error("Truncated parameter file " + filename);
    }
    in.close();

    return HEALParams(N, t, depth, sec);
}

HEALSystem::HEALSystem(HEALParams p) : params(p) {
    params.validate_parameters();

    CCParams<CryptoContextBFVRNS> parameters;
    parameters.SetPlaintextModulus(params.plain_modulus);
    parameters.SetMultiplicativeDepth(params.mult_depth);
    parameters.SetSecurityLevel(params.sec_level);
    parameters.SetRingDim(params.ring_dim);

    context = GenCryptoContext(parameters);
    context->Enable(PKE);
    context->Enable(LEVELEDSHE);
}

void HEALSystem::generate_keys() {
    KeyPair<DCRTPoly> kp = context->KeyGen();
    if (!kp.good()) {
        throw std::runtime_error("Key generation failed");
    }
    public_key = kp.publicKey;
    secret_key = kp.secretKey;
}

Plaintext HEALSystem::encode_limbs(uint64_t value) const {
    vector<int64_t> slots(kLimbCount, 0);
    const uint64_t mask = (1ULL << kLimbBits) - 1;
    for (size_t i = 0; i < kLimbCount; i++) {
        slots[i] = static_cast<int64_t>((value >> (kLimbBits * i)) & mask);
    }
    return context->MakePackedPlaintext(slots);
}

CiphertextHandle HEALSystem::encrypt(uint64_t value) const {
    if (!can_encrypt()) {
        throw std::runtime_error("No public key loaded");
    }
    if (value >= params.plain_modulus) {
        throw std::runtime_error("Plaintext exceeds plaintext modulus");
    }

    vector<int64_t> slots(kLimbCount, 0);
    slots[0] = static_cast<int64_t>(value);
    return context->Encrypt(public_key, context->MakePackedPlaintext(slots));
}

CiphertextHandle HEALSystem::encrypt_zero() const {
    return encrypt(0);
}

CiphertextHandle HEALSystem::encrypt_timestamp(uint64_t timestamp) const {
    if (!can_encrypt()) {
        throw std::runtime_error("No public key loaded");
    }
    return context->Encrypt(public_key, encode_limbs(timestamp));
}

EncryptedReading HEALSystem::encrypt_reading(uint64_t usage, uint64_t timestamp,
                                             uint64_t load) const {
    EncryptedReading reading;
    reading.usage = encrypt(usage);
    reading.timestamp = encrypt_timestamp(timestamp);
    reading.load = encrypt(load);
    return reading;
}

CiphertextHandle HEALSystem::add(const CiphertextHandle& a, const CiphertextHandle& b) const {
    return context->EvalAdd(a, b);
}

uint64_t HEALSystem::decrypt(const CiphertextHandle& ct) const {
    if (!can_decrypt()) {
        throw std::runtime_error("No secret key loaded");
    }
    if (!ct) {
        throw std::runtime_error("Null ciphertext");
    }

    Plaintext pt;
    DecryptResult res = context->Decrypt(secret_key, ct, &pt);
    if (!res.isValid) {
        throw std::runtime_error("Decryption failed");
    }
    pt->SetLength(kLimbCount);

    const auto& slots = pt->GetPackedValue();
    const int64_t t = static_cast<int64_t>(params.plain_modulus);

    uint64_t value = 0;
    for (size_t i = 0; i < kLimbCount && i < slots.size(); i++) {
        // Packed values come back centered in (-t/2, t/2].
        int64_t slot = slots[i] % t;
        if (slot < 0) slot += t;
        value += static_cast<uint64_t>(slot) << (kLimbBits * i);
    }
    return value;
}

void HEALSystem::save_context(const string& filename) const {
    if (!Serial::SerializeToFile(filename, context, SerType::BINARY)) {
        throw runtime_error("Failed to write crypto context to " + filename);
    }
}

void HEALSystem::load_context(const string& filename) {
    // Keys deserialized afterwards must bind to this context, not the one
    // generated in the constructor.
    CryptoContextFactory<DCRTPoly>::ReleaseAllContexts();

    CryptoContext<DCRTPoly> loaded;
    if (!Serial::DeserializeFromFile(filename, loaded, SerType::BINARY)) {
        throw runtime_error("Failed to read crypto context from " + filename);
    }
    context = loaded;
    params.ring_dim = context->GetRingDimension();
    params.plain_modulus = context->GetCryptoParameters()->GetPlaintextModulus();
    public_key = nullptr;
    secret_key = nullptr;
}

void HEALSystem::save_public_key(const string& filename) const {
    if (!can_encrypt()) {
        throw runtime_error("No public key to save");
    }
    if (!Serial::SerializeToFile(filename, public_key, SerType::BINARY)) {
        throw runtime_error("Failed to write public key to " + filename);
    }
}

void HEALSystem::load_public_key(const string& filename) {
    PublicKey<DCRTPoly> pk;
    if (!Serial::DeserializeFromFile(filename, pk, SerType::BINARY)) {
        throw runtime_error("Failed to read public key from " + filename);
    }
    public_key = pk;
}

void HEALSystem::save_secret_key(const string& filename) const {
    if (!can_decrypt()) {
        throw runtime_error("No secret key to save");
    }
    if (!Serial::SerializeToFile(filename, secret_key, SerType::BINARY)) {
        throw runtime_error("Failed to write secret key to " + filename);
    }
}

void HEALSystem::load_secret_key(const string& filename) {
    PrivateKey<DCRTPoly> sk;
    if (!Serial::DeserializeFromFile(filename, sk, SerType::BINARY)) {
        throw runtime_error("Failed to read secret key from " + filename);
    }
    secret_key = sk;
}

void HEALSystem::save_reading(const EncryptedReading& reading, const string& filename) const {
    vector<CiphertextHandle> cts{reading.usage, reading.timestamp, reading.load};
    if (!Serial::SerializeToFile(filename, cts, SerType::BINARY)) {
        throw runtime_error("Failed to write reading to " + filename);
    }
}

EncryptedReading HEALSystem::load_reading(const string& filename) const {
    vector<CiphertextHandle> cts;
    if (!Serial::DeserializeFromFile(filename, cts, SerType::BINARY)) {
        throw runtime_error("Failed to read reading from " + filename);
    }
    if (cts.size() != 3) {
        throw runtime_error(
            "Reading file " + filename + " holds " + to_string(cts.size()) +
            " ciphertexts, expected 3"
        );
    }

    EncryptedReading reading;
    reading.usage = cts[0];
    reading.timestamp = cts[1];
    reading.load = cts[2];
    return reading;
}

size_t HEALSystem::serialized_size(const CiphertextHandle& ct) const {
    std::stringstream ss;
    Serial::Serialize(ct, ss, SerType::BINARY);
    return ss.str().size();
}

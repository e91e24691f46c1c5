#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <openssl/rand.h>

// =========================
// Minimal CLI parsing
// =========================
static inline bool arg_eq(const char* a, const char* b) { return std::string(a) == std::string(b); }

static inline uint64_t read_u64_flag(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw std::runtime_error(std::string("missing value after ") + argv[i]);
    return (uint64_t)std::stoull(std::string(argv[++i]));
}

static inline std::string read_str_flag(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw std::runtime_error(std::string("missing value after ") + argv[i]);
    return std::string(argv[++i]);
}

// =========================
// Files / directories
// =========================
static inline bool file_exists_nonempty(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return in.good() && in.peek() != std::ifstream::traits_type::eof();
}

static inline void ensure_dir_exists(const std::string& dir) {
    std::filesystem::create_directories(std::filesystem::path(dir));
}

static inline void ensure_parent_exists(const std::string& path) {
    std::filesystem::path p(path);
    if (!p.parent_path().empty()) std::filesystem::create_directories(p.parent_path());
}

// =========================
// Oracle signing key (32 bytes, HMAC-SHA256)
// - Generated once by setup, shared by the oracle and whoever verifies its proofs.
// =========================
template <size_t N>
static inline void create_key_file_if_missing(const std::string& path) {
    if (file_exists_nonempty(path)) return;

    ensure_parent_exists(path);

    std::array<uint8_t, N> key{};
    if (RAND_bytes(key.data(), (int)key.size()) != 1) throw std::runtime_error("RAND_bytes failed (key file)");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good()) throw std::runtime_error("failed to open for write: " + path);
    out.write((const char*)key.data(), (std::streamsize)key.size());
    out.close();
}

template <size_t N>
static inline std::array<uint8_t, N> load_key_file(const std::string& path) {
    if (!file_exists_nonempty(path)) throw std::runtime_error("key file missing/empty: " + path);

    std::ifstream in(path, std::ios::binary);
    if (!in.good()) throw std::runtime_error("failed to open: " + path);

    std::array<uint8_t, N> key{};
    in.read((char*)key.data(), (std::streamsize)key.size());
    if (in.gcount() != (std::streamsize)N) {
        throw std::runtime_error("key file wrong size (need " + std::to_string(N) + " bytes): " + path);
    }
    return key;
}

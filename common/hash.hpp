#pragma once

// ============================================================
// hash.hpp -- Content fingerprints (SHA-256) and wire checksums (xxHash3)
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <functional>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

// OpenSSL EVP context, opaque here
typedef struct evp_md_ctx_st EVP_MD_CTX;

// Hashing primitive unavailable or failed; uploads must fail, not skip dedup
class FingerprintError : public std::runtime_error {
public:
    explicit FingerprintError(const std::string& what) : std::runtime_error(what) {}
};

namespace hash {

// 32-byte (256-bit) content digest
using Fingerprint = std::array<u8, 32>;

// ---- xxHash3: transport integrity only, never a dedup key ----

inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

// ---- SHA-256 via OpenSSL EVP ----

// Streaming SHA-256; throws FingerprintError on any EVP failure
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void reset();
    void update(const void* data, size_t len);

    // Finalises; call reset() before reusing
    Fingerprint digest();

private:
    EVP_MD_CTX* ctx_;
};

// One-shot fingerprint of a memory buffer
Fingerprint fingerprint(const void* data, size_t len);

inline std::string to_hex(const Fingerprint& fp) {
    return utils::to_hex(fp);
}

// Hash functor so Fingerprint can key unordered containers. The digest is
// already uniformly distributed; the first 8 bytes are enough.
struct FingerprintHasher {
    size_t operator()(const Fingerprint& fp) const noexcept {
        u64 v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | fp[(size_t)i];
        return (size_t)v;
    }
};

} // namespace hash

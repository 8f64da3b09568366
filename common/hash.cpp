// ============================================================
// hash.cpp -- SHA-256 fingerprinting on top of OpenSSL EVP
// ============================================================

#include "hash.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>

namespace {

std::string openssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    std::string msg = std::string(what) + " failed";
    if (code != 0) {
        char buf[256] = {0};
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    return msg;
}

} // namespace

namespace hash {

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw FingerprintError(openssl_error("EVP_MD_CTX_new"));
    try {
        reset();
    } catch (...) {
        EVP_MD_CTX_free(ctx_);
        throw;
    }
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Sha256Hasher::reset() {
    const EVP_MD* md = EVP_sha256();
    if (!md) throw FingerprintError(openssl_error("EVP_sha256"));
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        throw FingerprintError(openssl_error("EVP_DigestInit_ex"));
    }
}

void Sha256Hasher::update(const void* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw FingerprintError(openssl_error("EVP_DigestUpdate"));
    }
}

Fingerprint Sha256Hasher::digest() {
    Fingerprint out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &out_len) != 1) {
        throw FingerprintError(openssl_error("EVP_DigestFinal_ex"));
    }
    if (out_len != out.size()) {
        throw FingerprintError("SHA-256 produced " + std::to_string(out_len) + " bytes");
    }
    return out;
}

Fingerprint fingerprint(const void* data, size_t len) {
    // Fed in 64 MB steps
    static constexpr size_t STEP = 64u * 1024u * 1024u;
    Sha256Hasher h;
    const u8* p = static_cast<const u8*>(data);
    while (len > 0) {
        size_t n = len < STEP ? len : STEP;
        h.update(p, n);
        p += n;
        len -= n;
    }
    return h.digest();
}

} // namespace hash

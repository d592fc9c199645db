#pragma once

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace eccrypt::crypto::detail {

// RAII wrappers for OpenSSL resources
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

struct EVPPKEYCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept {
        if (ctx) EVP_PKEY_CTX_free(ctx);
    }
};

struct EVPPKEYDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) EVP_PKEY_free(key);
    }
};

struct ECKeyDeleter {
    void operator()(EC_KEY* key) const noexcept {
        if (key) EC_KEY_free(key);
    }
};

struct ECPointDeleter {
    void operator()(EC_POINT* point) const noexcept {
        if (point) EC_POINT_clear_free(point);
    }
};

// Scalars handled here are secret; always clear on release.
struct BignumDeleter {
    void operator()(BIGNUM* bn) const noexcept {
        if (bn) BN_clear_free(bn);
    }
};

struct BNCtxDeleter {
    void operator()(BN_CTX* ctx) const noexcept {
        if (ctx) BN_CTX_free(ctx);
    }
};

struct ECDSASigDeleter {
    void operator()(ECDSA_SIG* sig) const noexcept {
        if (sig) ECDSA_SIG_free(sig);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;
using UniquePKEYCtx = std::unique_ptr<EVP_PKEY_CTX, EVPPKEYCtxDeleter>;
using UniquePKEY = std::unique_ptr<EVP_PKEY, EVPPKEYDeleter>;
using UniqueEcKey = std::unique_ptr<EC_KEY, ECKeyDeleter>;
using UniqueEcPoint = std::unique_ptr<EC_POINT, ECPointDeleter>;
using UniqueBignum = std::unique_ptr<BIGNUM, BignumDeleter>;
using UniqueBNCtx = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using UniqueEcdsaSig = std::unique_ptr<ECDSA_SIG, ECDSASigDeleter>;

// Wipes a secret buffer when the enclosing scope exits, including by throw.
class CleanseGuard {
public:
    explicit CleanseGuard(std::vector<std::uint8_t>& buffer) noexcept : buffer_(buffer) {}
    ~CleanseGuard() {
        if (!buffer_.empty()) {
            OPENSSL_cleanse(buffer_.data(), buffer_.size());
        }
    }

    CleanseGuard(const CleanseGuard&) = delete;
    CleanseGuard& operator=(const CleanseGuard&) = delete;

private:
    std::vector<std::uint8_t>& buffer_;
};

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::vector<std::uint8_t>& src) {
    if (src.empty()) return;
    dest.insert(dest.end(), src.begin(), src.end());
}

}  // namespace eccrypt::crypto::detail

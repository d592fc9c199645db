#include "eccrypt/crypto.hpp"

#include "eccrypt/constants.hpp"
#include "eccrypt/crypto_utils.hpp"
#include "eccrypt/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace eccrypt::crypto {

namespace {

using detail::UniqueCipherCtx;
using detail::UniqueMDCtx;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

Bytes Digest(const EVP_MD* md, const Bytes& data, const char* label) {
    UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(std::string(label) + " context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes out(static_cast<std::size_t>(EVP_MD_size(md)));
    Ensure(EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1, "digest init failed");
    if (!data.empty()) {
        Ensure(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1, "digest update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "digest final failed");
    out.resize(out_len);
    return out;
}

void CheckCbcParams(const Bytes& iv, const Bytes& key) {
    if (key.size() != constants::kEncryptionKeyLen) {
        Throw(ErrorKind::kInvalidKey, "AES-256-CBC expects 32-byte key");
    }
    if (iv.size() != constants::kIvLen) {
        Throw(ErrorKind::kInvalidInput, "AES-256-CBC expects 16-byte IV");
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Sha256(const Bytes& data) {
    return Digest(EVP_sha256(), data, "SHA-256");
}

Bytes Sha512(const Bytes& data) {
    return Digest(EVP_sha512(), data, "SHA-512");
}

Bytes HmacSha256(const Bytes& key, const Bytes& data) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(),
              data.size(), out.data(), &out_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

Bytes Aes256CbcEncrypt(const Bytes& iv, const Bytes& key, const Bytes& plaintext) {
    CheckCbcParams(iv, key);
    Bytes out(plaintext.size() + constants::kAesBlockLen);
    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext.data(),
                                 static_cast<int>(plaintext.size())) == 1,
               "AES-CBC encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1,
           "AES-CBC final failed");
    total_len += out_len;

    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

Bytes Aes256CbcDecrypt(const Bytes& iv, const Bytes& key, const Bytes& ciphertext) {
    CheckCbcParams(iv, key);
    if (ciphertext.empty() || ciphertext.size() % constants::kAesBlockLen != 0) {
        Throw(ErrorKind::kCipherFailure, "AES-CBC ciphertext is not a whole number of blocks");
    }
    Bytes out(ciphertext.size() + constants::kAesBlockLen);
    detail::CleanseGuard wipe_on_failure(out);
    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
        Throw(ErrorKind::kCipherFailure, "AES-CBC decrypt failed");
    }
    total_len += out_len;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) != 1) {
        Throw(ErrorKind::kCipherFailure, "AES-CBC bad decrypt (invalid padding)");
    }
    total_len += out_len;

    Bytes plaintext(out.begin(), out.begin() + total_len);
    return plaintext;
}

bool ConstantTimeEqual(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace eccrypt::crypto

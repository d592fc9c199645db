#pragma once

#include <cstddef>

#include "eccrypt/types.hpp"

namespace eccrypt::crypto {

Bytes RandomBytes(std::size_t size);

Bytes Sha256(const Bytes& data);
Bytes Sha512(const Bytes& data);
Bytes HmacSha256(const Bytes& key, const Bytes& data);

// AES-256-CBC with PKCS#7 padding. A padding failure on decrypt throws
// Error(kCipherFailure); callers authenticate the ciphertext first.
Bytes Aes256CbcEncrypt(const Bytes& iv, const Bytes& key, const Bytes& plaintext);
Bytes Aes256CbcDecrypt(const Bytes& iv, const Bytes& key, const Bytes& ciphertext);

// Length mismatch returns early; equal-length inputs are compared without
// data-dependent branches.
bool ConstantTimeEqual(const Bytes& a, const Bytes& b);

}  // namespace eccrypt::crypto

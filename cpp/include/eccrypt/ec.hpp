#pragma once

#include <string>
#include <string_view>

#include "eccrypt/crypto_utils.hpp"
#include "eccrypt/types.hpp"

namespace eccrypt::ec {

struct KeyPair {
    Bytes private_key;  // 32-byte big-endian scalar
    Bytes public_key;   // 33-byte compressed point
};

// Decodes a private key in hex (64 chars, or 66 with a trailing "01"
// compression flag) into a validated 32-byte scalar. Throws kInvalidKey.
Bytes ParsePrivateKey(std::string_view text);

// Decodes a compressed or uncompressed public key in hex and returns its
// compressed encoding. Throws kInvalidKey when off-curve or malformed.
Bytes ParsePublicKey(std::string_view text);

// Same as ParsePublicKey for an already decoded SEC1 point.
Bytes NormalizePublicKey(const Bytes& encoded);

Bytes PublicKeyFromPrivate(const Bytes& private_key);
std::string GetPublicKeyFromPrivate(std::string_view private_key_hex);

KeyPair GenerateKeyPair();

// ECDH x-coordinate, always exactly 32 bytes.
Bytes DeriveSharedSecret(const Bytes& private_key, const Bytes& public_key);

// Left-pads a big-endian magnitude to the 32-byte field width. A longer
// value is an encoding bug and throws kEncoding.
Bytes FitToFieldSize(const Bytes& magnitude);
std::string FieldElementToHex(const Bytes& magnitude);

namespace detail {

crypto::detail::UniqueBignum CurveOrder(const EC_GROUP* group);
crypto::detail::UniqueEcKey LoadPrivateKey(const Bytes& private_key);
crypto::detail::UniqueEcKey LoadPublicKey(const Bytes& public_key);
Bytes EncodeCompressed(const EC_GROUP* group, const EC_POINT* point);
Bytes BignumToField(const BIGNUM* bn);

}  // namespace detail

}  // namespace eccrypt::ec

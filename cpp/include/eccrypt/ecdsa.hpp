#pragma once

#include <string_view>

#include "eccrypt/error.hpp"
#include "eccrypt/hex.hpp"
#include "eccrypt/types.hpp"

namespace eccrypt::ecdsa {

struct SignatureResult {
    HexBytes signature;   // DER
    HexBytes public_key;  // compressed, derived from the signing key
};

// SHA-256 over content, signed with an RFC 6979 deterministic nonce.
Result<SignatureResult> Sign(std::string_view private_key_hex, const Content& content);

// false for a well-formed signature that does not match; kInvalidInput for a
// malformed public key or DER signature.
Result<bool> Verify(const Content& content, std::string_view public_key_hex, std::string_view signature_hex);

}  // namespace eccrypt::ecdsa

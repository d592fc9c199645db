#pragma once

#include <string>
#include <string_view>

#include "eccrypt/error.hpp"
#include "eccrypt/hex.hpp"
#include "eccrypt/types.hpp"

namespace eccrypt::ecies {

struct DerivedKeys {
    Bytes encryption_key;  // first half of SHA-512(secret)
    Bytes hmac_key;        // second half
};

DerivedKeys DeriveKeys(const Bytes& shared_secret);

// Bytes the MAC covers: iv || ephemeral_pk (compressed) || cipher_text.
Bytes MacInput(const Bytes& iv, const Bytes& ephemeral_pk, const Bytes& cipher_text);

struct CipherObject {
    HexBytes iv;
    HexBytes ephemeral_pk;
    HexBytes cipher_text;
    HexBytes mac;
    bool was_string = false;

    struct Wire {
        std::string iv;
        std::string ephemeral_pk;
        std::string cipher_text;
        std::string mac;
        bool was_string = false;
    };

    // Builds an object from hex fields. Fails with kInvalidInput on bad hex
    // or a wrong-length iv/mac.
    static Result<CipherObject> FromHex(const Wire& wire);
    Wire ToHex() const;
};

Result<CipherObject> Encrypt(std::string_view public_key_hex, const Content& content);

// Deterministic core of Encrypt with caller-supplied ephemeral scalar and IV.
// Reusing either across calls breaks confidentiality; intended for vectors.
Result<CipherObject> EncryptWithEphemeral(std::string_view public_key_hex,
                                          const Content& content,
                                          const Bytes& ephemeral_private_key,
                                          const Bytes& iv);

// Verifies the MAC before touching the ciphertext. On success returns the
// plaintext as text when the object was produced from text.
Result<Content> Decrypt(std::string_view private_key_hex, const CipherObject& cipher);

}  // namespace eccrypt::ecies

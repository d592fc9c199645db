#include "eccrypt/ecies.hpp"

#include "eccrypt/constants.hpp"
#include "eccrypt/crypto.hpp"
#include "eccrypt/crypto_utils.hpp"
#include "eccrypt/ec.hpp"

#include <openssl/err.h>

#include <utility>

namespace eccrypt::ecies {

namespace {

using crypto::detail::AppendBytes;
using crypto::detail::CleanseGuard;

struct ScopedKeys {
    DerivedKeys keys;
    CleanseGuard wipe_enc{keys.encryption_key};
    CleanseGuard wipe_mac{keys.hmac_key};

    explicit ScopedKeys(DerivedKeys derived) : keys(std::move(derived)) {}
};

HexBytes ParseField(const std::string& text, const char* field) {
    auto parsed = HexBytes::Parse(text);
    if (!parsed) {
        Throw(ErrorKind::kInvalidInput, std::string("CipherObject field is not valid hex: ") + field);
    }
    return std::move(*parsed);
}

CipherObject Seal(const Bytes& recipient_pk,
                  const Content& content,
                  const Bytes& ephemeral_sk,
                  const Bytes& iv) {
    if (iv.size() != constants::kIvLen) {
        Throw(ErrorKind::kInvalidInput, "IV must be 16 bytes");
    }
    Bytes plaintext = ContentBytes(content);
    CleanseGuard wipe_plaintext(plaintext);

    Bytes ephemeral_pk = ec::PublicKeyFromPrivate(ephemeral_sk);
    Bytes shared = ec::DeriveSharedSecret(ephemeral_sk, recipient_pk);
    CleanseGuard wipe_shared(shared);
    ScopedKeys derived(DeriveKeys(shared));

    Bytes cipher_text = crypto::Aes256CbcEncrypt(iv, derived.keys.encryption_key, plaintext);
    Bytes mac = crypto::HmacSha256(derived.keys.hmac_key, MacInput(iv, ephemeral_pk, cipher_text));

    CipherObject out;
    out.iv = HexBytes(iv);
    out.ephemeral_pk = HexBytes(std::move(ephemeral_pk));
    out.cipher_text = HexBytes(std::move(cipher_text));
    out.mac = HexBytes(std::move(mac));
    out.was_string = IsText(content);
    return out;
}

Content Open(const Bytes& own_sk, const CipherObject& cipher) {
    // A damaged ephemeral key is reported like any other tampering. The MAC
    // covers the compressed form regardless of how the key arrived.
    Bytes ephemeral_pk;
    try {
        ephemeral_pk = ec::NormalizePublicKey(cipher.ephemeral_pk.bytes());
    } catch (const Error& err) {
        if (err.kind() != ErrorKind::kInvalidKey) {
            throw;
        }
        ERR_clear_error();
        Throw(ErrorKind::kMacMismatch, constants::kMacFailureMessage);
    }
    Bytes shared = ec::DeriveSharedSecret(own_sk, ephemeral_pk);
    CleanseGuard wipe_shared(shared);
    ScopedKeys derived(DeriveKeys(shared));

    Bytes actual_mac = crypto::HmacSha256(derived.keys.hmac_key,
                                          MacInput(cipher.iv.bytes(), ephemeral_pk, cipher.cipher_text.bytes()));
    if (!crypto::ConstantTimeEqual(cipher.mac.bytes(), actual_mac)) {
        Throw(ErrorKind::kMacMismatch, constants::kMacFailureMessage);
    }

    Bytes plaintext = crypto::Aes256CbcDecrypt(cipher.iv.bytes(), derived.keys.encryption_key,
                                               cipher.cipher_text.bytes());
    if (cipher.was_string) {
        std::string text(plaintext.begin(), plaintext.end());
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return Content(std::move(text));
    }
    return Content(std::move(plaintext));
}

}  // namespace

DerivedKeys DeriveKeys(const Bytes& shared_secret) {
    Bytes hashed = crypto::Sha512(shared_secret);
    CleanseGuard wipe(hashed);
    DerivedKeys keys;
    keys.encryption_key.assign(hashed.begin(), hashed.begin() + constants::kEncryptionKeyLen);
    keys.hmac_key.assign(hashed.begin() + constants::kEncryptionKeyLen, hashed.end());
    return keys;
}

Bytes MacInput(const Bytes& iv, const Bytes& ephemeral_pk, const Bytes& cipher_text) {
    Bytes data;
    data.reserve(iv.size() + ephemeral_pk.size() + cipher_text.size());
    AppendBytes(data, iv);
    AppendBytes(data, ephemeral_pk);
    AppendBytes(data, cipher_text);
    return data;
}

Result<CipherObject> CipherObject::FromHex(const Wire& wire) {
    return Capture([&wire] {
        CipherObject out;
        out.iv = ParseField(wire.iv, "iv");
        out.ephemeral_pk = ParseField(wire.ephemeral_pk, "ephemeralPK");
        out.cipher_text = ParseField(wire.cipher_text, "cipherText");
        out.mac = ParseField(wire.mac, "mac");
        out.was_string = wire.was_string;
        if (out.iv.size() != constants::kIvLen) {
            Throw(ErrorKind::kInvalidInput, "CipherObject iv must be 16 bytes");
        }
        if (out.mac.size() != constants::kMacLen) {
            Throw(ErrorKind::kInvalidInput, "CipherObject mac must be 32 bytes");
        }
        return out;
    });
}

CipherObject::Wire CipherObject::ToHex() const {
    Wire wire;
    wire.iv = iv.hex();
    wire.ephemeral_pk = ephemeral_pk.hex();
    wire.cipher_text = cipher_text.hex();
    wire.mac = mac.hex();
    wire.was_string = was_string;
    return wire;
}

Result<CipherObject> Encrypt(std::string_view public_key_hex, const Content& content) {
    return Capture([&] {
        Bytes recipient_pk = ec::ParsePublicKey(public_key_hex);
        ec::KeyPair ephemeral = ec::GenerateKeyPair();
        CleanseGuard wipe(ephemeral.private_key);
        Bytes iv = crypto::RandomBytes(constants::kIvLen);
        return Seal(recipient_pk, content, ephemeral.private_key, iv);
    });
}

Result<CipherObject> EncryptWithEphemeral(std::string_view public_key_hex,
                                          const Content& content,
                                          const Bytes& ephemeral_private_key,
                                          const Bytes& iv) {
    return Capture([&] {
        Bytes recipient_pk = ec::ParsePublicKey(public_key_hex);
        return Seal(recipient_pk, content, ephemeral_private_key, iv);
    });
}

Result<Content> Decrypt(std::string_view private_key_hex, const CipherObject& cipher) {
    return Capture([&] {
        Bytes own_sk = ec::ParsePrivateKey(private_key_hex);
        CleanseGuard wipe(own_sk);
        return Open(own_sk, cipher);
    });
}

}  // namespace eccrypt::ecies

#include "eccrypt/ec.hpp"

#include "eccrypt/constants.hpp"
#include "eccrypt/error.hpp"
#include "eccrypt/hex.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <stdexcept>
#include <string>

namespace eccrypt::ec {

namespace {

using crypto::detail::CleanseGuard;
using crypto::detail::UniqueBignum;
using crypto::detail::UniqueBNCtx;
using crypto::detail::UniqueEcKey;
using crypto::detail::UniqueEcPoint;
using crypto::detail::UniquePKEY;
using crypto::detail::UniquePKEYCtx;

UniqueBNCtx NewBnCtx() {
    UniqueBNCtx ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate BN_CTX");
    }
    return ctx;
}

UniquePKEY ToPkey(const EC_KEY* ec_key) {
    UniquePKEY pkey(EVP_PKEY_new());
    if (!pkey) {
        throw std::runtime_error("Failed to allocate EVP_PKEY");
    }
    if (EVP_PKEY_set1_EC_KEY(pkey.get(), const_cast<EC_KEY*>(ec_key)) != 1) {
        throw std::runtime_error("Failed to assign EC key");
    }
    return pkey;
}

UniquePKEY GenerateKey() {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to initialize EC keygen");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init EC keygen");
    }
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_secp256k1) != 1) {
        throw std::runtime_error("Failed to set EC curve");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw std::runtime_error("Failed to generate EC key");
    }
    return UniquePKEY(raw);
}

Bytes DeriveShared(EVP_PKEY* priv, EVP_PKEY* peer) {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new(priv, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to init ECDH ctx");
    }
    if (EVP_PKEY_derive_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init ECDH derive");
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
        Throw(ErrorKind::kInvalidKey, "Failed to set ECDH peer");
    }
    std::size_t len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1 || len == 0) {
        throw std::runtime_error("Failed to size ECDH shared secret");
    }
    Bytes shared(len);
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1) {
        OPENSSL_cleanse(shared.data(), shared.size());
        throw std::runtime_error("Failed to derive ECDH shared secret");
    }
    shared.resize(len);
    return shared;
}

}  // namespace

namespace detail {

UniqueBignum CurveOrder(const EC_GROUP* group) {
    UniqueBignum order(BN_dup(EC_GROUP_get0_order(group)));
    if (!order) {
        throw std::runtime_error("Failed to read curve order");
    }
    return order;
}

Bytes BignumToField(const BIGNUM* bn) {
    Bytes magnitude(static_cast<std::size_t>(BN_num_bytes(bn)));
    CleanseGuard wipe(magnitude);
    if (!magnitude.empty()) {
        BN_bn2bin(bn, magnitude.data());
    }
    return FitToFieldSize(magnitude);
}

UniqueEcKey LoadPrivateKey(const Bytes& private_key) {
    if (private_key.size() != constants::kPrivateKeyLen) {
        Throw(ErrorKind::kInvalidKey, "Private key must be 32 bytes");
    }
    UniqueEcKey ec_key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!ec_key) {
        throw std::runtime_error("Failed to create EC key");
    }
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    UniqueBignum scalar(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
    if (!scalar) {
        throw std::runtime_error("Failed to load private scalar");
    }
    if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group)) >= 0) {
        Throw(ErrorKind::kInvalidKey, "Private key is out of range for secp256k1");
    }
    if (EC_KEY_set_private_key(ec_key.get(), scalar.get()) != 1) {
        Throw(ErrorKind::kInvalidKey, "Failed to set EC private key");
    }
    UniqueBNCtx bn_ctx = NewBnCtx();
    UniqueEcPoint point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("Failed to create EC point");
    }
    if (EC_POINT_mul(group, point.get(), scalar.get(), nullptr, nullptr, bn_ctx.get()) != 1) {
        throw std::runtime_error("Failed to compute EC public key");
    }
    if (EC_KEY_set_public_key(ec_key.get(), point.get()) != 1) {
        throw std::runtime_error("Failed to set EC public key");
    }
    return ec_key;
}

UniqueEcKey LoadPublicKey(const Bytes& public_key) {
    if (public_key.size() != constants::kCompressedPointLen
        && public_key.size() != constants::kUncompressedPointLen) {
        Throw(ErrorKind::kInvalidKey, "Public key must be a 33 or 65 byte SEC1 point");
    }
    UniqueEcKey ec_key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!ec_key) {
        throw std::runtime_error("Failed to create EC key");
    }
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    UniqueBNCtx bn_ctx = NewBnCtx();
    UniqueEcPoint point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("Failed to create EC point");
    }
    if (EC_POINT_oct2point(group, point.get(), public_key.data(), public_key.size(), bn_ctx.get()) != 1) {
        ERR_clear_error();
        Throw(ErrorKind::kInvalidKey, "Invalid EC public key encoding");
    }
    if (EC_POINT_is_at_infinity(group, point.get()) == 1
        || EC_POINT_is_on_curve(group, point.get(), bn_ctx.get()) != 1) {
        Throw(ErrorKind::kInvalidKey, "EC public key is not a point on secp256k1");
    }
    if (EC_KEY_set_public_key(ec_key.get(), point.get()) != 1) {
        Throw(ErrorKind::kInvalidKey, "Failed to set EC public key");
    }
    return ec_key;
}

Bytes EncodeCompressed(const EC_GROUP* group, const EC_POINT* point) {
    std::size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED, nullptr, 0, nullptr);
    if (len != constants::kCompressedPointLen) {
        throw std::runtime_error("Failed to encode EC public key");
    }
    Bytes out(len);
    if (EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), nullptr) != len) {
        throw std::runtime_error("Failed to encode EC public key");
    }
    return out;
}

}  // namespace detail

Bytes FitToFieldSize(const Bytes& magnitude) {
    if (magnitude.size() > constants::kFieldLen) {
        Throw(ErrorKind::kEncoding, "Generated a > 32-byte field element. Failing.");
    }
    Bytes out(constants::kFieldLen - magnitude.size(), 0);
    out.insert(out.end(), magnitude.begin(), magnitude.end());
    return out;
}

std::string FieldElementToHex(const Bytes& magnitude) {
    return hex::Encode(FitToFieldSize(magnitude));
}

Bytes ParsePrivateKey(std::string_view text) {
    std::string_view digits = text;
    const std::string_view suffix(constants::kCompressedKeySuffix);
    if (digits.size() == constants::kFieldHexLen + suffix.size()
        && digits.substr(constants::kFieldHexLen) == suffix) {
        digits = digits.substr(0, constants::kFieldHexLen);
    }
    if (digits.size() != constants::kFieldHexLen) {
        Throw(ErrorKind::kInvalidKey, "Private key must be 64 hex characters");
    }
    auto raw = hex::Decode(digits);
    if (!raw) {
        Throw(ErrorKind::kInvalidKey, "Private key is not valid hex");
    }
    Bytes scalar = std::move(*raw);
    try {
        // Loading range-checks the scalar.
        detail::LoadPrivateKey(scalar);
    } catch (...) {
        OPENSSL_cleanse(scalar.data(), scalar.size());
        throw;
    }
    return scalar;
}

Bytes NormalizePublicKey(const Bytes& encoded) {
    UniqueEcKey ec_key = detail::LoadPublicKey(encoded);
    return detail::EncodeCompressed(EC_KEY_get0_group(ec_key.get()), EC_KEY_get0_public_key(ec_key.get()));
}

Bytes ParsePublicKey(std::string_view text) {
    auto raw = hex::Decode(text);
    if (!raw) {
        Throw(ErrorKind::kInvalidKey, "Public key is not valid hex");
    }
    return NormalizePublicKey(*raw);
}

Bytes PublicKeyFromPrivate(const Bytes& private_key) {
    UniqueEcKey ec_key = detail::LoadPrivateKey(private_key);
    return detail::EncodeCompressed(EC_KEY_get0_group(ec_key.get()), EC_KEY_get0_public_key(ec_key.get()));
}

std::string GetPublicKeyFromPrivate(std::string_view private_key_hex) {
    Bytes scalar = ParsePrivateKey(private_key_hex);
    CleanseGuard wipe(scalar);
    return hex::Encode(PublicKeyFromPrivate(scalar));
}

KeyPair GenerateKeyPair() {
    UniquePKEY pkey = GenerateKey();
    UniqueEcKey ec_key(EVP_PKEY_get1_EC_KEY(pkey.get()));
    if (!ec_key) {
        throw std::runtime_error("EC key expected");
    }
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    const BIGNUM* scalar = EC_KEY_get0_private_key(ec_key.get());
    const EC_POINT* point = EC_KEY_get0_public_key(ec_key.get());
    if (!group || !scalar || !point) {
        throw std::runtime_error("Generated EC key is incomplete");
    }
    KeyPair pair;
    pair.private_key = detail::BignumToField(scalar);
    pair.public_key = detail::EncodeCompressed(group, point);
    return pair;
}

Bytes DeriveSharedSecret(const Bytes& private_key, const Bytes& public_key) {
    UniqueEcKey own = detail::LoadPrivateKey(private_key);
    UniqueEcKey peer = detail::LoadPublicKey(public_key);
    UniquePKEY own_pkey = ToPkey(own.get());
    UniquePKEY peer_pkey = ToPkey(peer.get());
    Bytes shared = DeriveShared(own_pkey.get(), peer_pkey.get());
    CleanseGuard wipe(shared);
    return FitToFieldSize(shared);
}

}  // namespace eccrypt::ec

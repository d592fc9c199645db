#include "eccrypt/ecdsa.hpp"

#include "eccrypt/constants.hpp"
#include "eccrypt/crypto.hpp"
#include "eccrypt/crypto_utils.hpp"
#include "eccrypt/ec.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>

#include <stdexcept>

namespace eccrypt::ecdsa {

namespace {

using crypto::detail::AppendBytes;
using crypto::detail::CleanseGuard;
using crypto::detail::UniqueBignum;
using crypto::detail::UniqueBNCtx;
using crypto::detail::UniqueEcdsaSig;
using crypto::detail::UniqueEcKey;
using crypto::detail::UniqueEcPoint;

UniqueBignum BignumFromBytes(const Bytes& data) {
    UniqueBignum bn(BN_bin2bn(data.data(), static_cast<int>(data.size()), nullptr));
    if (!bn) {
        throw std::runtime_error("Failed to load big number");
    }
    return bn;
}

// HMAC-SHA256 DRBG from RFC 6979 section 3.2, seeded with the private
// scalar and the digest reduced mod n.
class NonceGenerator {
public:
    NonceGenerator(const Bytes& private_key, const Bytes& reduced_digest)
        : key_(constants::kSha256Len, 0x00), value_(constants::kSha256Len, 0x01) {
        Bytes seed = private_key;
        CleanseGuard wipe(seed);
        AppendBytes(seed, reduced_digest);
        Update(seed);
    }

    ~NonceGenerator() {
        OPENSSL_cleanse(key_.data(), key_.size());
        OPENSSL_cleanse(value_.data(), value_.size());
    }

    NonceGenerator(const NonceGenerator&) = delete;
    NonceGenerator& operator=(const NonceGenerator&) = delete;

    Bytes Next() {
        if (generated_) {
            Update({});
        }
        value_ = crypto::HmacSha256(key_, value_);
        generated_ = true;
        return value_;
    }

private:
    void Update(const Bytes& seed) {
        Round(0x00, seed);
        if (!seed.empty()) {
            Round(0x01, seed);
        }
    }

    void Round(std::uint8_t marker, const Bytes& seed) {
        Bytes data = value_;
        CleanseGuard wipe(data);
        data.push_back(marker);
        AppendBytes(data, seed);
        key_ = crypto::HmacSha256(key_, data);
        value_ = crypto::HmacSha256(key_, value_);
    }

    Bytes key_;
    Bytes value_;
    bool generated_ = false;
};

Bytes EncodeDer(const ECDSA_SIG* sig) {
    int len = i2d_ECDSA_SIG(sig, nullptr);
    if (len <= 0) {
        throw std::runtime_error("Failed to size DER signature");
    }
    Bytes der(static_cast<std::size_t>(len));
    unsigned char* out = der.data();
    if (i2d_ECDSA_SIG(sig, &out) != len) {
        throw std::runtime_error("Failed to encode DER signature");
    }
    return der;
}

UniqueEcdsaSig SignDigest(const Bytes& private_key, const Bytes& digest) {
    UniqueEcKey ec_key = ec::detail::LoadPrivateKey(private_key);
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    UniqueBignum order = ec::detail::CurveOrder(group);
    UniqueBNCtx bn_ctx(BN_CTX_new());
    if (!bn_ctx) {
        throw std::runtime_error("Failed to allocate BN_CTX");
    }

    UniqueBignum z = BignumFromBytes(digest);
    if (BN_nnmod(z.get(), z.get(), order.get(), bn_ctx.get()) != 1) {
        throw std::runtime_error("Failed to reduce digest");
    }
    Bytes reduced = ec::detail::BignumToField(z.get());
    NonceGenerator nonces(private_key, reduced);

    UniqueEcPoint point(EC_POINT_new(group));
    UniqueBignum x(BN_new());
    UniqueBignum r(BN_new());
    if (!point || !x || !r) {
        throw std::runtime_error("Failed to allocate signing state");
    }
    for (;;) {
        Bytes candidate = nonces.Next();
        CleanseGuard wipe(candidate);
        UniqueBignum k = BignumFromBytes(candidate);
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);
        if (BN_is_zero(k.get()) || BN_cmp(k.get(), order.get()) >= 0) {
            continue;
        }
        if (EC_POINT_mul(group, point.get(), k.get(), nullptr, nullptr, bn_ctx.get()) != 1
            || EC_POINT_get_affine_coordinates(group, point.get(), x.get(), nullptr, bn_ctx.get()) != 1
            || BN_nnmod(r.get(), x.get(), order.get(), bn_ctx.get()) != 1) {
            throw std::runtime_error("Failed to compute ECDSA commitment");
        }
        if (BN_is_zero(r.get())) {
            continue;
        }
        UniqueBignum k_inv(BN_mod_inverse(nullptr, k.get(), order.get(), bn_ctx.get()));
        if (!k_inv) {
            throw std::runtime_error("Failed to invert ECDSA nonce");
        }
        UniqueEcdsaSig sig(ECDSA_do_sign_ex(digest.data(), static_cast<int>(digest.size()),
                                            k_inv.get(), r.get(), ec_key.get()));
        if (!sig) {
            ERR_clear_error();
            throw std::runtime_error("ECDSA signing failed");
        }
        return sig;
    }
}

UniqueEcKey LoadVerifyingKey(std::string_view public_key_hex) {
    auto raw = hex::Decode(public_key_hex);
    if (!raw) {
        Throw(ErrorKind::kInvalidInput, "Public key is not valid hex");
    }
    try {
        return ec::detail::LoadPublicKey(*raw);
    } catch (const Error& err) {
        ERR_clear_error();
        Throw(ErrorKind::kInvalidInput, err.what());
    }
}

UniqueEcdsaSig ParseDer(std::string_view signature_hex) {
    auto der = hex::Decode(signature_hex);
    if (!der || der->empty()) {
        Throw(ErrorKind::kInvalidInput, "Signature is not valid hex");
    }
    const unsigned char* ptr = der->data();
    UniqueEcdsaSig sig(d2i_ECDSA_SIG(nullptr, &ptr, static_cast<long>(der->size())));
    if (!sig) {
        ERR_clear_error();
        Throw(ErrorKind::kInvalidInput, "Malformed DER signature");
    }
    if (ptr != der->data() + der->size()) {
        Throw(ErrorKind::kInvalidInput, "Trailing bytes after DER signature");
    }
    return sig;
}

}  // namespace

Result<SignatureResult> Sign(std::string_view private_key_hex, const Content& content) {
    return Capture([&] {
        Bytes private_key = ec::ParsePrivateKey(private_key_hex);
        CleanseGuard wipe(private_key);
        Bytes digest = crypto::Sha256(ContentBytes(content));
        UniqueEcdsaSig sig = SignDigest(private_key, digest);

        auto public_key = HexBytes::Parse(ec::GetPublicKeyFromPrivate(private_key_hex));
        if (!public_key) {
            throw std::runtime_error("Derived public key is not valid hex");
        }
        SignatureResult result;
        result.signature = HexBytes(EncodeDer(sig.get()));
        result.public_key = std::move(*public_key);
        return result;
    });
}

Result<bool> Verify(const Content& content, std::string_view public_key_hex, std::string_view signature_hex) {
    return Capture([&] {
        Bytes digest = crypto::Sha256(ContentBytes(content));
        UniqueEcKey ec_key = LoadVerifyingKey(public_key_hex);
        UniqueEcdsaSig sig = ParseDer(signature_hex);
        int rc = ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), ec_key.get());
        if (rc < 0) {
            ERR_clear_error();
            throw std::runtime_error("ECDSA verification error");
        }
        if (rc == 0) {
            ERR_clear_error();
        }
        return rc == 1;
    });
}

}  // namespace eccrypt::ecdsa

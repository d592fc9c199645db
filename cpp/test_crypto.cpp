#include <catch2/catch.hpp>

#include "eccrypt/crypto.hpp"
#include "eccrypt/error.hpp"
#include "eccrypt/hex.hpp"

#include <string>

namespace eccrypt::crypto {

namespace {

Bytes FromHex(const std::string& text) {
    return hex::Decode(text).value();
}

Bytes FromText(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

const Bytes kKey = FromHex("2f473dfa24b74716e5c4c718c94905503ecee915ba1c6291a5d6fb58f477ad66");
const Bytes kIv = FromHex("000102030405060708090a0b0c0d0e0f");

}  // namespace

TEST_CASE("SHA-256 and HMAC-SHA256 known answers") {
    CHECK(hex::Encode(Sha256(FromText("abc"))) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(hex::Encode(HmacSha256(FromText("key"), FromText("The quick brown fox jumps over the lazy dog"))) ==
          "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
    CHECK(Sha512({}).size() == 64);
}

TEST_CASE("RandomBytes returns fresh output") {
    Bytes a = RandomBytes(16);
    Bytes b = RandomBytes(16);
    CHECK(a.size() == 16);
    CHECK(a != b);
    CHECK(RandomBytes(0).empty());
}

TEST_CASE("AES-256-CBC pads to whole blocks") {
    CHECK(hex::Encode(Aes256CbcEncrypt(kIv, kKey, {})) == "cf7e0bc560a4d77722044bf60e6415b7");
    CHECK(Aes256CbcEncrypt(kIv, kKey, Bytes(15, 0x41)).size() == 16);
    CHECK(Aes256CbcEncrypt(kIv, kKey, Bytes(16, 0x41)).size() == 32);
}

TEST_CASE("AES-256-CBC decrypt inverts encrypt") {
    Bytes plaintext = FromText("all work and no play makes jack a dull boy");
    Bytes ciphertext = Aes256CbcEncrypt(kIv, kKey, plaintext);
    CHECK(Aes256CbcDecrypt(kIv, kKey, ciphertext) == plaintext);
    CHECK(Aes256CbcDecrypt(kIv, kKey, Aes256CbcEncrypt(kIv, kKey, {})).empty());
}

TEST_CASE("AES-256-CBC rejects bad parameters and broken ciphertext") {
    SECTION("key length") {
        CHECK_THROWS_AS(Aes256CbcEncrypt(kIv, Bytes(16, 0), {}), Error);
    }
    SECTION("iv length") {
        CHECK_THROWS_AS(Aes256CbcEncrypt(Bytes(12, 0), kKey, {}), Error);
    }
    SECTION("partial block") {
        try {
            (void)Aes256CbcDecrypt(kIv, kKey, Bytes(17, 0));
            FAIL("expected a cipher failure");
        } catch (const Error& err) {
            CHECK(err.kind() == ErrorKind::kCipherFailure);
        }
    }
    SECTION("invalid padding") {
        // A final block of 0x00 padding is never valid PKCS#7.
        Bytes padded(16, 0x00);
        Bytes ciphertext = Aes256CbcEncrypt(kIv, kKey, padded);
        ciphertext.resize(16);
        try {
            (void)Aes256CbcDecrypt(kIv, kKey, ciphertext);
            FAIL("expected a cipher failure");
        } catch (const Error& err) {
            CHECK(err.kind() == ErrorKind::kCipherFailure);
        }
    }
}

TEST_CASE("ConstantTimeEqual compares lengths 0 through 64") {
    for (std::size_t len = 0; len <= 64; ++len) {
        Bytes a(len);
        for (std::size_t i = 0; i < len; ++i) {
            a[i] = static_cast<std::uint8_t>(i * 7 + len);
        }
        Bytes b = a;
        CHECK(ConstantTimeEqual(a, b));
        for (std::size_t i = 0; i < len; ++i) {
            Bytes c = a;
            c[i] ^= 0x01;
            CHECK_FALSE(ConstantTimeEqual(a, c));
        }
        Bytes longer = a;
        longer.push_back(0);
        CHECK_FALSE(ConstantTimeEqual(a, longer));
        CHECK_FALSE(ConstantTimeEqual(longer, a));
    }
}

}  // namespace eccrypt::crypto

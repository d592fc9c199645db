#include <catch2/catch.hpp>

#include "eccrypt/hex.hpp"

#include <optional>

namespace eccrypt {

namespace {

// Decoded during static initialization, before main runs.
const std::optional<Bytes> kStaticDecoded = hex::Decode("0102ff");
const std::optional<Bytes> kStaticRejected = hex::Decode("zz");

}  // namespace

TEST_CASE("Hex decoding works from static initializers") {
    REQUIRE(kStaticDecoded);
    CHECK(hex::Encode(*kStaticDecoded) == "0102ff");
    CHECK_FALSE(kStaticRejected);
}

TEST_CASE("Hex encoding is lowercase") {
    CHECK(hex::Encode({}) == "");
    CHECK(hex::Encode({0x00, 0x01, 0xab, 0xff}) == "0001abff");
}

TEST_CASE("Hex decoding") {
    SECTION("mixed case") {
        auto decoded = hex::Decode("DeadBEEF");
        REQUIRE(decoded);
        CHECK(*decoded == Bytes{0xde, 0xad, 0xbe, 0xef});
    }
    SECTION("empty") {
        auto decoded = hex::Decode("");
        REQUIRE(decoded);
        CHECK(decoded->empty());
    }
    SECTION("odd length") { CHECK_FALSE(hex::Decode("abc")); }
    SECTION("non-hex characters") {
        CHECK_FALSE(hex::Decode("zz"));
        CHECK_FALSE(hex::Decode("0x12"));
        CHECK_FALSE(hex::Decode("12 4"));
    }
}

TEST_CASE("HexBytes wraps parsed bytes") {
    auto parsed = HexBytes::Parse("00ff10");
    REQUIRE(parsed);
    CHECK(parsed->size() == 3);
    CHECK(parsed->hex() == "00ff10");
    CHECK(*parsed == HexBytes(Bytes{0x00, 0xff, 0x10}));
    CHECK_FALSE(HexBytes::Parse("0g"));
}

}  // namespace eccrypt

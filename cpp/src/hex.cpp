#include "eccrypt/hex.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace eccrypt {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Constant-initialized so Decode is usable from static initializers in
// other translation units.
constexpr std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = 0xFF;
    }
    for (std::uint8_t i = 0; i < 10; ++i) {
        table[static_cast<std::uint8_t>('0' + i)] = i;
    }
    for (std::uint8_t i = 0; i < 6; ++i) {
        table[static_cast<std::uint8_t>('a' + i)] = static_cast<std::uint8_t>(10 + i);
        table[static_cast<std::uint8_t>('A' + i)] = static_cast<std::uint8_t>(10 + i);
    }
    return table;
}

constexpr std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

namespace hex {

std::string Encode(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::optional<Bytes> Decode(std::string_view input) {
    if (input.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(input.size() / 2);
    for (std::size_t i = 0; i < input.size(); i += 2) {
        std::uint8_t hi = kDecTable[static_cast<std::uint8_t>(input[i])];
        std::uint8_t lo = kDecTable[static_cast<std::uint8_t>(input[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace hex

std::optional<HexBytes> HexBytes::Parse(std::string_view text) {
    auto raw = hex::Decode(text);
    if (!raw) {
        return std::nullopt;
    }
    return HexBytes(std::move(*raw));
}

}  // namespace eccrypt

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "eccrypt/types.hpp"

namespace eccrypt {

namespace hex {

std::string Encode(const Bytes& data);
std::optional<Bytes> Decode(std::string_view input);

}  // namespace hex

// Raw bytes that cross a textual boundary as lowercase hex. Parsing is the
// only way in from text, so an unchecked string never reaches the crypto.
class HexBytes {
public:
    HexBytes() = default;
    explicit HexBytes(Bytes raw) : bytes_(std::move(raw)) {}

    static std::optional<HexBytes> Parse(std::string_view text);

    const Bytes& bytes() const noexcept { return bytes_; }
    std::size_t size() const noexcept { return bytes_.size(); }
    bool empty() const noexcept { return bytes_.empty(); }
    std::string hex() const { return hex::Encode(bytes_); }

    bool operator==(const HexBytes& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const HexBytes& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

}  // namespace eccrypt

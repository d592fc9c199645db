#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace eccrypt {

using Bytes = std::vector<std::uint8_t>;

// Either text or raw bytes; decryption restores whichever was encrypted.
using Content = std::variant<std::string, Bytes>;

inline bool IsText(const Content& content) {
    return std::holds_alternative<std::string>(content);
}

inline Bytes ContentBytes(const Content& content) {
    if (const auto* text = std::get_if<std::string>(&content)) {
        return Bytes(text->begin(), text->end());
    }
    return std::get<Bytes>(content);
}

}  // namespace eccrypt

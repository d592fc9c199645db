#pragma once

#include <cstddef>

namespace eccrypt::constants {

// secp256k1 field and scalar width
inline constexpr std::size_t kFieldLen = 32;
inline constexpr std::size_t kFieldHexLen = kFieldLen * 2;
inline constexpr std::size_t kPrivateKeyLen = 32;
inline constexpr std::size_t kCompressedPointLen = 33;
inline constexpr std::size_t kUncompressedPointLen = 65;

// Trailing compression flag some key encodings append to the scalar.
inline constexpr char kCompressedKeySuffix[] = "01";

inline constexpr std::size_t kIvLen = 16;
inline constexpr std::size_t kAesBlockLen = 16;
inline constexpr std::size_t kEncryptionKeyLen = 32;
inline constexpr std::size_t kHmacKeyLen = 32;
inline constexpr std::size_t kMacLen = 32;
inline constexpr std::size_t kSha256Len = 32;
inline constexpr std::size_t kSha512Len = 64;

inline constexpr char kMacFailureMessage[] = "Decryption failed: failure in MAC check";

}  // namespace eccrypt::constants

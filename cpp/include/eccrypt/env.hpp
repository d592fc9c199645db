#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace eccrypt::env {

inline constexpr char kPrivateKeyVar[] = "ECCRYPT_PRIVATE_KEY";
inline constexpr char kNoColorVar[] = "ECCRYPT_NO_COLOR";

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Resolves a CLI key argument: "-" reads ECCRYPT_PRIVATE_KEY, anything else
// is returned as given. Empty result means the variable was not set.
std::optional<std::string> ResolvePrivateKey(const std::string& arg);

}  // namespace eccrypt::env

#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace eccrypt::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
}

// TTY detection, overridden by ECCRYPT_NO_COLOR / NO_COLOR or --no-color.
bool ColorsEnabled(std::ostream& os = std::cout);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }
inline std::string BoldGreen(const std::string& text) { return Colorize(text, color::BOLD_GREEN); }
inline std::string BoldRed(const std::string& text) { return Colorize(text, color::BOLD_RED); }
inline std::string ErrorText(const std::string& text) { return Colorize(text, color::RED, std::cerr); }

}  // namespace eccrypt::cli

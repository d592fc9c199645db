#include "eccrypt/cli_colors.hpp"

#include "eccrypt/env.hpp"

#include <iostream>

#include <unistd.h>

namespace eccrypt::cli {

namespace {

struct StreamState {
    bool enabled = false;
    bool checked = false;
};

StreamState g_stdout;
StreamState g_stderr;

bool ColorsDisabledByEnv() {
    return env::IsEnabled(env::kNoColorVar) || !env::Get("NO_COLOR").empty();
}

}  // namespace

bool ColorsEnabled(std::ostream& os) {
    StreamState& state = (&os == &std::cerr) ? g_stderr : g_stdout;
    if (!state.checked) {
        int fd = (&os == &std::cerr) ? STDERR_FILENO : STDOUT_FILENO;
        state.enabled = isatty(fd) != 0 && !ColorsDisabledByEnv();
        state.checked = true;
    }
    return state.enabled;
}

void SetColorsEnabled(bool enabled) {
    g_stdout = {enabled, true};
    g_stderr = {enabled, true};
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace eccrypt::cli

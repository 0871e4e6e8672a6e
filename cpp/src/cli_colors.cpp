#include "sealdrop/cli_colors.hpp"

#include "sealdrop/env.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace sealdrop::cli {

namespace {

enum class Override { kNone, kOn, kOff };

std::atomic<Override> g_override{Override::kNone};

bool DetectTty(int fd) {
    if (!env::Get("NO_COLOR").empty()) {
        return false;
    }
    return isatty(fd) != 0;
}

}  // namespace

bool ColorsEnabled(std::ostream& os) {
    Override forced = g_override.load();
    if (forced != Override::kNone) {
        return forced == Override::kOn;
    }
    static const bool stdout_tty = DetectTty(fileno(stdout));
    static const bool stderr_tty = DetectTty(fileno(stderr));
    if (&os == &std::cout) {
        return stdout_tty;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_override.store(enabled ? Override::kOn : Override::kOff);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace sealdrop::cli

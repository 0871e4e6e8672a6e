#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace sealdrop::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when the stream is a terminal and colors were not switched off.
// Detection runs once per stream.
bool ColorsEnabled(std::ostream& os = std::cout);

// --no-color and NO_COLOR end up here.
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text) { return Colorize(text, color::RED); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text) { return Colorize(text, color::YELLOW); }
inline std::string Dim(const std::string& text) { return Colorize(text, color::BRIGHT_BLACK); }

inline std::string BoldGreen(const std::string& text) { return Colorize(text, color::BOLD_GREEN); }
inline std::string BoldYellow(const std::string& text) { return Colorize(text, color::BOLD_YELLOW); }

}  // namespace sealdrop::cli

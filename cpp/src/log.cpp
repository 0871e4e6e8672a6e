#include "sealdrop/log.hpp"

#include "sealdrop/cli_colors.hpp"
#include "sealdrop/env.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace sealdrop::log {

namespace {

std::mutex g_write_mutex;

std::atomic<bool>& VerboseFlag() {
    static std::atomic<bool> flag{env::IsEnabled("SEALDROP_VERBOSE")};
    return flag;
}

void Write(const char* label, const char* color, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << cli::Colorize(label, color, std::cerr) << ' ' << message << '\n';
}

}  // namespace

void Info(const std::string& message) {
    if (!Verbose()) {
        return;
    }
    Write("INFO:", cli::color::CYAN, message);
}

void Warn(const std::string& message) {
    Write("WARN:", cli::color::BOLD_YELLOW, message);
}

void SetVerbose(bool verbose) {
    VerboseFlag().store(verbose);
}

bool Verbose() {
    return VerboseFlag().load();
}

}  // namespace sealdrop::log

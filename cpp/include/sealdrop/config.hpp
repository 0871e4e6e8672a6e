#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>

#include "sealdrop/constants.hpp"
#include "sealdrop/retry.hpp"
#include "sealdrop/session.hpp"

namespace sealdrop::transfer {

struct TransferConfig {
    std::size_t max_concurrency = constants::kMaxConcurrentUploads;
    RetryPolicy retry;
    Sleeper sleep = ThreadSleeper();
    std::function<TimePoint()> now = [] { return Clock::now(); };
};

// Process-wide settings resolved from SEALDROP_* variables. Values that do
// not parse fall back to the defaults.
struct ClientSettings {
    std::filesystem::path state_file;
    std::size_t max_concurrency = constants::kMaxConcurrentUploads;
    std::uint32_t max_attempts = constants::kMaxRetryAttempts;
    bool verbose = false;

    static ClientSettings FromEnvironment();
    TransferConfig ToTransferConfig() const;
};

std::filesystem::path DefaultStateFile();

}  // namespace sealdrop::transfer

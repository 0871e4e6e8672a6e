#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "sealdrop/constants.hpp"

namespace sealdrop::transfer {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper ThreadSleeper();

class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(std::uint32_t max_attempts, std::chrono::milliseconds base_delay);

    std::uint32_t max_attempts() const noexcept { return max_attempts_; }
    // Wait after the given 1-based failed attempt: base * 2^(attempt - 1),
    // so 1s then 2s with the defaults.
    std::chrono::milliseconds Delay(std::uint32_t attempt) const;

    // Runs fn until it returns. A sealdrop::Error that is not Retryable() is
    // rethrown at once, anything else is retried with backoff. between_attempts
    // runs after each backoff sleep, right before the next attempt, and may
    // throw to abandon the loop. After the
    // last attempt the final exception propagates; attempts_used receives the
    // count either way.
    void Run(const std::function<void()>& fn,
             const Sleeper& sleep,
             const std::function<void(std::uint32_t attempt, const std::string& reason)>& between_attempts,
             std::uint32_t& attempts_used) const;

private:
    std::uint32_t max_attempts_ = constants::kMaxRetryAttempts;
    std::chrono::milliseconds base_delay_{constants::kRetryBaseDelayMs};
};

}  // namespace sealdrop::transfer

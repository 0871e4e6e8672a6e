#include "sealdrop/retry.hpp"

#include "sealdrop/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace sealdrop::transfer {

Sleeper ThreadSleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

RetryPolicy::RetryPolicy(std::uint32_t max_attempts, std::chrono::milliseconds base_delay)
    : max_attempts_(max_attempts), base_delay_(base_delay) {
    if (max_attempts_ == 0) {
        throw std::invalid_argument("Retry policy needs at least one attempt");
    }
    if (base_delay_.count() < 0) {
        throw std::invalid_argument("Retry delay must not be negative");
    }
}

std::chrono::milliseconds RetryPolicy::Delay(std::uint32_t attempt) const {
    const std::uint32_t shift = std::min<std::uint32_t>(attempt == 0 ? 0 : attempt - 1, 20);
    return base_delay_ * (std::int64_t{1} << shift);
}

void RetryPolicy::Run(const std::function<void()>& fn,
                      const Sleeper& sleep,
                      const std::function<void(std::uint32_t, const std::string&)>& between_attempts,
                      std::uint32_t& attempts_used) const {
    for (std::uint32_t attempt = 1;; ++attempt) {
        attempts_used = attempt;
        std::string reason;
        try {
            fn();
            return;
        } catch (const Error& e) {
            if (!e.Retryable() || attempt >= max_attempts_) {
                throw;
            }
            reason = e.what();
        } catch (const std::exception& e) {
            if (attempt >= max_attempts_) {
                throw;
            }
            reason = e.what();
        }
        if (sleep) {
            sleep(Delay(attempt));
        }
        if (between_attempts) {
            between_attempts(attempt, reason);
        }
    }
}

}  // namespace sealdrop::transfer

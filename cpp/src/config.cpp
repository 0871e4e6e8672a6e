#include "sealdrop/config.hpp"

#include "sealdrop/env.hpp"

#include <limits>

namespace sealdrop::transfer {

std::filesystem::path DefaultStateFile() {
    std::string home = env::Get("HOME");
    std::filesystem::path base = home.empty() ? std::filesystem::path(".") : std::filesystem::path(home);
    return base / ".sealdrop" / "sessions.yaml";
}

ClientSettings ClientSettings::FromEnvironment() {
    ClientSettings settings;
    std::string state = env::Get("SEALDROP_STATE_FILE");
    settings.state_file = state.empty() ? DefaultStateFile() : std::filesystem::path(state);

    std::uint64_t workers = env::GetUnsigned("SEALDROP_MAX_CONCURRENT_UPLOADS", constants::kMaxConcurrentUploads);
    settings.max_concurrency = workers > 64 ? constants::kMaxConcurrentUploads : static_cast<std::size_t>(workers);

    std::uint64_t attempts = env::GetUnsigned("SEALDROP_MAX_RETRY_ATTEMPTS", constants::kMaxRetryAttempts);
    settings.max_attempts = attempts > 16 ? constants::kMaxRetryAttempts : static_cast<std::uint32_t>(attempts);

    settings.verbose = env::IsEnabled("SEALDROP_VERBOSE");
    return settings;
}

TransferConfig ClientSettings::ToTransferConfig() const {
    TransferConfig config;
    config.max_concurrency = max_concurrency;
    config.retry = RetryPolicy(max_attempts, std::chrono::milliseconds(constants::kRetryBaseDelayMs));
    return config;
}

}  // namespace sealdrop::transfer

#include "sealdrop/upload_api.hpp"

#include <stdexcept>

namespace sealdrop::transfer {

void UploadOptions::Validate() const {
    if (expiration_hours < 1 || expiration_hours > constants::kMaxExpirationHours) {
        throw std::invalid_argument("expiration_hours must be between 1 and " +
                                    std::to_string(constants::kMaxExpirationHours));
    }
    if (max_downloads && *max_downloads == 0) {
        throw std::invalid_argument("max_downloads must be positive");
    }
}

}  // namespace sealdrop::transfer

#pragma once

#include <cstddef>
#include <string>

#include "sealdrop/constants.hpp"

namespace sealdrop::password {

// Heuristic score in [0, 100]. Advisory only.
int EstimateStrength(const std::string& password);
// "Weak", "Fair", "Good" or "Strong".
const char* StrengthLabel(int score);
bool MeetsThreshold(const std::string& password, int threshold = constants::kMinPasswordStrength);

// Uniform over A-Z a-z 0-9 !@#$%^&* from the CSPRNG.
std::string GenerateSecurePassword(std::size_t length = constants::kGeneratedPasswordLen);

}  // namespace sealdrop::password

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sealdrop::base64 {

// Standard alphabet with '=' padding, no line breaks.
std::string Encode(const std::vector<std::uint8_t>& data);
// Rejects whitespace, foreign characters, bad padding and lengths that are
// not a multiple of four.
std::optional<std::vector<std::uint8_t>> Decode(const std::string& input);

}  // namespace sealdrop::base64

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sealdrop::format {

using Bytes = std::vector<std::uint8_t>;

// [salt(32)][payload iv(16)][metadata iv(16)][metadata len u32 LE][metadata][payload]
struct EnvelopeParts {
    Bytes salt;
    Bytes payload_iv;
    Bytes metadata_iv;
    Bytes encrypted_metadata;
    Bytes encrypted_payload;
};

struct EnvelopeLayout {
    std::size_t total_len = 0;
    std::uint32_t metadata_len = 0;
    std::size_t metadata_offset = 0;
    std::size_t payload_offset = 0;
    std::size_t payload_len = 0;
};

struct NameParts {
    Bytes iv;
    Bytes sealed;
};

Bytes PackEnvelope(const EnvelopeParts& parts);
// Both throw MalformedEnvelope; neither touches key material.
EnvelopeLayout ReadLayout(const Bytes& envelope);
EnvelopeParts SplitEnvelope(const Bytes& envelope);

std::string PackName(const NameParts& parts);
std::optional<NameParts> SplitName(const std::string& encoded);

}  // namespace sealdrop::format

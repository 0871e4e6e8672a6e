#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sealdrop::metadata {

// Plaintext metadata sealed inside every envelope. Serialized with the same
// JSON keys the browser client writes.
struct EnvelopeMetadata {
    std::uint32_t version = 0;
    std::string algorithm;
    std::uint32_t kdf_iterations = 0;
    std::uint64_t original_size = 0;
    std::string original_name_encrypted;
    std::int64_t timestamp_ms = 0;
};

std::string ToJson(const EnvelopeMetadata& meta);
// Throws std::runtime_error on anything but a flat object carrying the
// required keys.
EnvelopeMetadata FromJson(std::string_view json);

std::int64_t NowMillis();

}  // namespace sealdrop::metadata

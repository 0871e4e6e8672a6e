#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sealdrop::constants {

inline constexpr std::size_t kSaltLen = 32;
inline constexpr std::size_t kPayloadIvLen = 16;
inline constexpr std::size_t kMetadataIvLen = 16;
inline constexpr std::size_t kNameIvLen = 12;
inline constexpr std::size_t kMetadataLengthLen = 4;
inline constexpr std::size_t kAeadTagLen = 16;
inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kEnvelopeHeaderLen = kSaltLen + kPayloadIvLen + kMetadataIvLen + kMetadataLengthLen;

inline constexpr std::uint32_t kKdfIterations = 600000;
inline constexpr std::uint32_t kEnvelopeVersion = 1;
inline constexpr std::string_view kAlgorithmName = "AES-GCM";
inline constexpr std::string_view kFallbackName = "encrypted_file";

inline constexpr std::size_t kReadBlockSize = 1u << 20;
inline constexpr double kReadProgressShare = 0.8;
inline constexpr double kEncryptProgressMark = 0.9;

inline constexpr std::uint64_t kDefaultChunkSize = 100ull * 1024ull * 1024ull;
inline constexpr std::size_t kMaxConcurrentUploads = 3;
inline constexpr std::uint32_t kMaxRetryAttempts = 3;
inline constexpr std::uint32_t kRetryBaseDelayMs = 1000;
inline constexpr std::uint32_t kSessionLifetimeHours = 24 * 7;
inline constexpr std::uint32_t kDefaultExpirationHours = 24;
inline constexpr std::uint32_t kMaxExpirationHours = 720;

inline constexpr std::string_view kStorageKey = "sealdrop_upload_sessions";
inline constexpr std::string_view kDefaultContentType = "application/octet-stream";
inline constexpr std::string_view kEnvelopeExt = ".sdx";

inline constexpr int kMinPasswordStrength = 30;
inline constexpr std::size_t kGeneratedPasswordLen = 32;

}  // namespace sealdrop::constants

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "sealdrop/crypto.hpp"
#include "sealdrop/format.hpp"
#include "sealdrop/metadata.hpp"

namespace sealdrop::envelope {

using Bytes = std::vector<std::uint8_t>;

// Receives a fraction in [0, 1]. Calls never decrease and 1 is delivered
// exactly once, on success.
using ProgressCallback = std::function<void(double)>;

struct DecryptResult {
    Bytes plaintext;
    std::string original_name;
    metadata::EnvelopeMetadata metadata;
};

crypto::CryptoSupport CheckCryptoSupport();
void EnsureCryptoSupport();

Bytes Encrypt(const Bytes& plaintext,
              const std::string& name,
              const std::string& password,
              const ProgressCallback& on_progress = {});

// Reads the file in bounded blocks; the envelope carries its file name.
Bytes EncryptFile(const std::filesystem::path& path,
                  const std::string& password,
                  const ProgressCallback& on_progress = {});

// Throws MalformedEnvelope, InvalidPassword or CorruptedPayload.
DecryptResult Decrypt(const Bytes& envelope,
                      const std::string& password,
                      const ProgressCallback& on_progress = {});

// Parses offsets and sizes only. Needs no password.
format::EnvelopeLayout Inspect(const Bytes& envelope);

void EncryptFileTo(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   const std::string& password,
                   const ProgressCallback& on_progress = {});

// When output is empty the plaintext lands next to the input under its
// recovered name. Returns the path written.
std::filesystem::path DecryptFileTo(const std::filesystem::path& input,
                                    const std::filesystem::path& output,
                                    const std::string& password,
                                    const ProgressCallback& on_progress = {});

namespace detail {

// Same envelope with a caller-chosen PBKDF2 cost. The count is not stored in
// the clear, so only DecryptWithIterations with the same count opens the
// result. Everything above always uses constants::kKdfIterations.
Bytes EncryptWithIterations(const Bytes& plaintext,
                            const std::string& name,
                            const std::string& password,
                            std::uint32_t iterations,
                            const ProgressCallback& on_progress = {});

DecryptResult DecryptWithIterations(const Bytes& envelope,
                                    const std::string& password,
                                    std::uint32_t iterations,
                                    const ProgressCallback& on_progress = {});

}  // namespace detail

}  // namespace sealdrop::envelope

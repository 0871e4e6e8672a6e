#include "sealdrop/envelope.hpp"

#include "sealdrop/constants.hpp"
#include "sealdrop/crypto.hpp"
#include "sealdrop/errors.hpp"
#include "sealdrop/file_stream.hpp"
#include "sealdrop/format.hpp"

#include <algorithm>
#include <stdexcept>

namespace sealdrop::envelope {

namespace {

class ProgressReporter {
public:
    explicit ProgressReporter(const ProgressCallback& callback) : callback_(callback) {}

    void Report(double fraction) {
        if (!callback_ || finished_) {
            return;
        }
        fraction = std::clamp(fraction, 0.0, 1.0);
        if (fraction < last_) {
            return;
        }
        last_ = fraction;
        if (fraction >= 1.0) {
            finished_ = true;
        }
        callback_(fraction);
    }

private:
    const ProgressCallback& callback_;
    double last_ = 0.0;
    bool finished_ = false;
};

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string RecoverName(const crypto::SecretKey& key, const std::string& encoded) {
    auto parts = format::SplitName(encoded);
    if (!parts) {
        return std::string(constants::kFallbackName);
    }
    try {
        Bytes name = crypto::AesGcmDecryptWithIv(key, parts->iv, parts->sealed);
        return std::string(name.begin(), name.end());
    } catch (const std::runtime_error&) {
        return std::string(constants::kFallbackName);
    }
}

// Everything after the plaintext has been read.
Bytes Seal(const Bytes& plaintext,
           const std::string& name,
           const std::string& password,
           std::uint32_t iterations,
           ProgressReporter& progress) {
    format::EnvelopeParts parts;
    parts.salt = crypto::RandomBytes(constants::kSaltLen);
    parts.payload_iv = crypto::RandomBytes(constants::kPayloadIvLen);
    do {
        parts.metadata_iv = crypto::RandomBytes(constants::kMetadataIvLen);
    } while (parts.metadata_iv == parts.payload_iv);

    crypto::SecretKey key = crypto::Pbkdf2HmacSha512(password, parts.salt, iterations, constants::kKeyLen);

    parts.encrypted_payload = crypto::AesGcmEncryptWithIv(key, parts.payload_iv, plaintext);
    progress.Report(constants::kEncryptProgressMark);

    format::NameParts name_parts;
    name_parts.iv = crypto::RandomBytes(constants::kNameIvLen);
    name_parts.sealed = crypto::AesGcmEncryptWithIv(key, name_parts.iv, ToBytes(name));

    metadata::EnvelopeMetadata meta;
    meta.version = constants::kEnvelopeVersion;
    meta.algorithm = std::string(constants::kAlgorithmName);
    meta.kdf_iterations = iterations;
    meta.original_size = plaintext.size();
    meta.original_name_encrypted = format::PackName(name_parts);
    meta.timestamp_ms = metadata::NowMillis();
    parts.encrypted_metadata = crypto::AesGcmEncryptWithIv(key, parts.metadata_iv, ToBytes(metadata::ToJson(meta)));

    Bytes envelope = format::PackEnvelope(parts);
    progress.Report(1.0);
    return envelope;
}

}  // namespace

crypto::CryptoSupport CheckCryptoSupport() {
    return crypto::CheckSupport();
}

void EnsureCryptoSupport() {
    crypto::EnsureSupport();
}

Bytes Encrypt(const Bytes& plaintext,
              const std::string& name,
              const std::string& password,
              const ProgressCallback& on_progress) {
    return detail::EncryptWithIterations(plaintext, name, password, constants::kKdfIterations, on_progress);
}

Bytes EncryptFile(const std::filesystem::path& path,
                  const std::string& password,
                  const ProgressCallback& on_progress) {
    crypto::EnsureSupport();
    ProgressReporter progress(on_progress);
    filestream::BufferedFileReader<constants::kReadBlockSize> reader(path);
    const std::uint64_t total = reader.TotalSize();

    Bytes plaintext;
    plaintext.reserve(static_cast<std::size_t>(total));
    while (reader.HasMore()) {
        auto [data, size] = reader.ReadChunk();
        if (size == 0) {
            break;
        }
        plaintext.insert(plaintext.end(), data, data + size);
        progress.Report(constants::kReadProgressShare * static_cast<double>(reader.BytesRead())
                        / static_cast<double>(total));
    }
    if (plaintext.size() != total) {
        throw std::runtime_error("File changed while reading: " + path.string());
    }
    progress.Report(constants::kReadProgressShare);

    Bytes envelope = Seal(plaintext, path.filename().string(), password, constants::kKdfIterations, progress);
    crypto::Cleanse(plaintext);
    return envelope;
}

DecryptResult Decrypt(const Bytes& envelope, const std::string& password, const ProgressCallback& on_progress) {
    return detail::DecryptWithIterations(envelope, password, constants::kKdfIterations, on_progress);
}

namespace detail {

Bytes EncryptWithIterations(const Bytes& plaintext,
                            const std::string& name,
                            const std::string& password,
                            std::uint32_t iterations,
                            const ProgressCallback& on_progress) {
    crypto::EnsureSupport();
    ProgressReporter progress(on_progress);
    progress.Report(constants::kReadProgressShare);
    return Seal(plaintext, name, password, iterations, progress);
}

DecryptResult DecryptWithIterations(const Bytes& envelope,
                                    const std::string& password,
                                    std::uint32_t iterations,
                                    const ProgressCallback& on_progress) {
    crypto::EnsureSupport();
    ProgressReporter progress(on_progress);
    format::EnvelopeParts parts = format::SplitEnvelope(envelope);
    progress.Report(0.1);

    crypto::SecretKey key = crypto::Pbkdf2HmacSha512(password, parts.salt, iterations, constants::kKeyLen);
    progress.Report(0.3);

    DecryptResult result;
    try {
        Bytes json = crypto::AesGcmDecryptWithIv(key, parts.metadata_iv, parts.encrypted_metadata);
        result.metadata = metadata::FromJson(std::string(json.begin(), json.end()));
    } catch (const std::runtime_error&) {
        throw InvalidPassword();
    }
    progress.Report(0.4);

    try {
        result.plaintext = crypto::AesGcmDecryptWithIv(key, parts.payload_iv, parts.encrypted_payload);
    } catch (const std::runtime_error&) {
        throw CorruptedPayload("Encrypted payload failed authentication");
    }
    if (result.plaintext.size() != result.metadata.original_size) {
        crypto::Cleanse(result.plaintext);
        throw CorruptedPayload("Decrypted payload size does not match the recorded size");
    }
    progress.Report(0.9);

    result.original_name = RecoverName(key, result.metadata.original_name_encrypted);
    progress.Report(1.0);
    return result;
}

}  // namespace detail

format::EnvelopeLayout Inspect(const Bytes& envelope) {
    return format::ReadLayout(envelope);
}

void EncryptFileTo(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   const std::string& password,
                   const ProgressCallback& on_progress) {
    Bytes envelope = EncryptFile(input, password, on_progress);
    filestream::WriteFileAtomic(output, envelope);
}

std::filesystem::path DecryptFileTo(const std::filesystem::path& input,
                                    const std::filesystem::path& output,
                                    const std::string& password,
                                    const ProgressCallback& on_progress) {
    Bytes envelope = filestream::ReadFile(input);
    DecryptResult result = Decrypt(envelope, password, on_progress);
    std::filesystem::path target = output;
    if (target.empty()) {
        // The recovered name is untrusted input; keep only its final component.
        std::filesystem::path name = std::filesystem::path(result.original_name).filename();
        if (name.empty() || name == "." || name == "..") {
            name = std::string(constants::kFallbackName);
        }
        target = input.parent_path() / name;
    }
    filestream::WriteFileAtomic(target, result.plaintext);
    crypto::Cleanse(result.plaintext);
    return target;
}

}  // namespace sealdrop::envelope

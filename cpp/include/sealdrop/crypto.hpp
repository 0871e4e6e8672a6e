#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sealdrop::crypto {

using Bytes = std::vector<std::uint8_t>;

struct CryptoSupport {
    bool supported = false;
    std::string error;
};

// Self-tests AES-256-GCM, SHA-512, SHA-256 and the CSPRNG.
CryptoSupport CheckSupport();
// Throws CryptoUnsupported with the failing check's reason.
void EnsureSupport();

// Derived key material. Move-only; wiped on destruction and never
// serialized anywhere.
class SecretKey {
public:
    explicit SecretKey(Bytes material);
    ~SecretKey();

    SecretKey(SecretKey&& other) noexcept;
    SecretKey& operator=(SecretKey&& other) noexcept;
    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;

    const std::uint8_t* data() const noexcept { return material_.data(); }
    std::size_t size() const noexcept { return material_.size(); }

private:
    Bytes material_;
};

Bytes RandomBytes(std::size_t size);
SecretKey Pbkdf2HmacSha512(const std::string& password, const Bytes& salt, std::uint32_t iterations, std::size_t length);

// Returns ciphertext || tag.
Bytes AesGcmEncryptWithIv(const SecretKey& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad = {});
// Expects ciphertext || tag; throws std::runtime_error when the tag does not verify.
Bytes AesGcmDecryptWithIv(const SecretKey& key, const Bytes& iv, const Bytes& blob, const Bytes& aad = {});

void Cleanse(Bytes& data) noexcept;
std::string HexEncode(const Bytes& data);

class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void Update(const std::uint8_t* data, std::size_t len);
    Bytes Final();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string Sha256Hex(const Bytes& data);

}  // namespace sealdrop::crypto

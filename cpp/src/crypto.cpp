#include "sealdrop/crypto.hpp"

#include "sealdrop/constants.hpp"
#include "sealdrop/crypto_utils.hpp"
#include "sealdrop/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace sealdrop::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

void CheckGcmArgs(const SecretKey& key, const Bytes& iv) {
    if (key.size() != constants::kKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
}

int CheckedLength(std::size_t len) {
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Buffer too large for a single cipher update");
    }
    return static_cast<int>(len);
}

// EVP_*Update takes an int length; feed large buffers in slices.
constexpr std::size_t kUpdateSlice = 1u << 30;

}  // namespace

CryptoSupport CheckSupport() {
    CryptoSupport result;
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    detail::UniqueCipher gcm(EVP_CIPHER_fetch(nullptr, "AES-256-GCM", nullptr));
    if (!gcm) {
        result.error = "AES-256-GCM is not available from the crypto provider";
        return result;
    }
    detail::UniqueMD sha512(EVP_MD_fetch(nullptr, "SHA512", nullptr));
    if (!sha512) {
        result.error = "SHA-512 is not available from the crypto provider";
        return result;
    }
    detail::UniqueMD sha256(EVP_MD_fetch(nullptr, "SHA256", nullptr));
    if (!sha256) {
        result.error = "SHA-256 is not available from the crypto provider";
        return result;
    }
#else
    if (!EVP_get_cipherbyname("aes-256-gcm")) {
        result.error = "AES-256-GCM is not available from the crypto library";
        return result;
    }
    if (!EVP_get_digestbyname("sha512") || !EVP_get_digestbyname("sha256")) {
        result.error = "SHA-2 digests are not available from the crypto library";
        return result;
    }
#endif
    if (RAND_status() != 1) {
        result.error = "Random number generator is not seeded";
        return result;
    }
    result.supported = true;
    return result;
}

void EnsureSupport() {
    CryptoSupport support = CheckSupport();
    if (!support.supported) {
        throw CryptoUnsupported(support.error);
    }
}

SecretKey::SecretKey(Bytes material) : material_(std::move(material)) {}

SecretKey::~SecretKey() {
    Cleanse(material_);
}

SecretKey::SecretKey(SecretKey&& other) noexcept : material_(std::move(other.material_)) {
    other.material_.clear();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
    if (this != &other) {
        Cleanse(material_);
        material_ = std::move(other.material_);
        other.material_.clear();
    }
    return *this;
}

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedLength(out.size())) == 1, "RAND_bytes failed");
    return out;
}

SecretKey Pbkdf2HmacSha512(const std::string& password, const Bytes& salt, std::uint32_t iterations, std::size_t length) {
    if (iterations == 0 || iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("PBKDF2 iteration count out of range");
    }
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), CheckedLength(password.size()), salt.data(),
                             CheckedLength(salt.size()), static_cast<int>(iterations), EVP_sha512(),
                             CheckedLength(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return SecretKey(std::move(out));
}

Bytes AesGcmEncryptWithIv(const SecretKey& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad) {
    CheckGcmArgs(key, iv);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    Bytes out(plaintext.size() + constants::kAeadTagLen);
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedLength(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLength(aad.size())) == 1,
               "AES-GCM aad failed");
    }
    for (std::size_t offset = 0; offset < plaintext.size(); offset += kUpdateSlice) {
        std::size_t len = std::min(kUpdateSlice, plaintext.size() - offset);
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data() + total_len, &out_len, plaintext.data() + offset,
                                 CheckedLength(len)) == 1,
               "AES-GCM encrypt failed");
        total_len += static_cast<std::size_t>(out_len);
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-GCM final failed");
    total_len += static_cast<std::size_t>(out_len);
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kAeadTagLen),
                               out.data() + total_len) == 1,
           "AES-GCM get tag failed");
    out.resize(total_len + constants::kAeadTagLen);
    return out;
}

Bytes AesGcmDecryptWithIv(const SecretKey& key, const Bytes& iv, const Bytes& blob, const Bytes& aad) {
    CheckGcmArgs(key, iv);
    if (blob.size() < constants::kAeadTagLen) {
        throw std::runtime_error("AES-GCM blob too short");
    }
    const std::size_t ct_len = blob.size() - constants::kAeadTagLen;
    Bytes tag(blob.end() - static_cast<std::ptrdiff_t>(constants::kAeadTagLen), blob.end());

    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    Bytes plaintext(ct_len);
    int out_len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedLength(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLength(aad.size())) == 1,
               "AES-GCM aad failed");
    }
    for (std::size_t offset = 0; offset < ct_len; offset += kUpdateSlice) {
        std::size_t len = std::min(kUpdateSlice, ct_len - offset);
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data() + total_len, &out_len, blob.data() + offset,
                                 CheckedLength(len)) == 1,
               "AES-GCM decrypt failed");
        total_len += static_cast<std::size_t>(out_len);
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
        Cleanse(plaintext);
        throw std::runtime_error("AES-GCM auth failed");
    }
    total_len += static_cast<std::size_t>(out_len);
    plaintext.resize(total_len);
    return plaintext;
}

void Cleanse(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

std::string HexEncode(const Bytes& data) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

struct Sha256::Impl {
    detail::UniqueMDCtx ctx;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (!impl_->ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    Ensure(EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
}

Sha256::~Sha256() = default;

void Sha256::Update(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(impl_->ctx.get(), data, len) == 1, "SHA-256 update failed");
}

Bytes Sha256::Final() {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    Ensure(EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    out.resize(out_len);
    return out;
}

std::string Sha256Hex(const Bytes& data) {
    Sha256 hasher;
    hasher.Update(data.data(), data.size());
    return HexEncode(hasher.Final());
}

}  // namespace sealdrop::crypto

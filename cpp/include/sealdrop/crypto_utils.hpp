#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

namespace sealdrop::crypto::detail {

struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

#if OPENSSL_VERSION_NUMBER >= 0x30000000L
struct EVPCipherDeleter {
    void operator()(EVP_CIPHER* cipher) const noexcept {
        if (cipher) EVP_CIPHER_free(cipher);
    }
};

struct EVPMDDeleter {
    void operator()(EVP_MD* md) const noexcept {
        if (md) EVP_MD_free(md);
    }
};

using UniqueCipher = std::unique_ptr<EVP_CIPHER, EVPCipherDeleter>;
using UniqueMD = std::unique_ptr<EVP_MD, EVPMDDeleter>;
#endif

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::uint8_t* src, std::size_t len) {
    if (len == 0) return;
    const std::size_t old_size = dest.size();
    dest.resize(old_size + len);
    std::memcpy(dest.data() + old_size, src, len);
}

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::vector<std::uint8_t>& src) {
    if (src.empty()) return;
    AppendBytes(dest, src.data(), src.size());
}

}  // namespace sealdrop::crypto::detail

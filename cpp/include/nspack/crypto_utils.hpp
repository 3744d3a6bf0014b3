#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

namespace nspack::crypto::detail {

struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::uint8_t* src, std::size_t len) {
    if (len == 0) return;
    const std::size_t old_size = dest.size();
    dest.resize(old_size + len);
    std::memcpy(dest.data() + old_size, src, len);
}

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::vector<std::uint8_t>& src) {
    AppendBytes(dest, src.data(), src.size());
}

}  // namespace nspack::crypto::detail

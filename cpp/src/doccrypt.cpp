#include "nspack/doccrypt.hpp"

#include "nspack/constants.hpp"
#include "nspack/crypto_utils.hpp"
#include "nspack/error.hpp"

#include <openssl/evp.h>

#include <array>
#include <string>

namespace nspack::doccrypt {

namespace {

using Block = std::array<std::uint8_t, constants::kBlockSize>;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

Block CounterBlock(std::uint32_t seed) {
    Block block{};
    block[4] = static_cast<std::uint8_t>(seed & 0xFF);
    block[5] = static_cast<std::uint8_t>((seed >> 8) & 0xFF);
    block[6] = static_cast<std::uint8_t>((seed >> 16) & 0xFF);
    block[7] = static_cast<std::uint8_t>((seed >> 24) & 0xFF);
    return block;
}

}  // namespace

void Protect(Bytes& data) {
    if (data.size() % constants::kBlockSize != 0) {
        throw Error(ErrorKind::InvalidBlockLength,
                    "Data length must be a multiple of 8 bytes, got " + std::to_string(data.size()));
    }
    if (data.empty()) {
        return;
    }

    crypto::detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    Ensure(ctx != nullptr, "3DES context allocation failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_des_ede3_ecb(), nullptr,
                              constants::kDocumentKey.data(), nullptr) == 1,
           "3DES init failed");
    Ensure(EVP_CIPHER_CTX_set_padding(ctx.get(), 0) == 1, "3DES set padding failed");

    std::uint32_t counter = 0;
    Block mask{};
    for (std::size_t offset = 0; offset < data.size(); offset += constants::kBlockSize) {
        const Block ivec = CounterBlock(constants::kIvecBase + counter);
        counter += 1;
        if (counter == constants::kCounterWrap) {
            counter = 0;
        }

        int out_len = 0;
        Ensure(EVP_EncryptUpdate(ctx.get(), mask.data(), &out_len, ivec.data(),
                                 static_cast<int>(ivec.size())) == 1,
               "3DES encrypt failed");
        Ensure(out_len == static_cast<int>(mask.size()), "3DES produced a short block");

        for (std::size_t i = 0; i < constants::kBlockSize; ++i) {
            data[offset + i] ^= mask[i];
        }
    }
}

}  // namespace nspack::doccrypt

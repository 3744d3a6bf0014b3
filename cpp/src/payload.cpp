#include "nspack/payload.hpp"

#include "nspack/cli_colors.hpp"
#include "nspack/constants.hpp"
#include "nspack/crypto_utils.hpp"
#include "nspack/deflate.hpp"
#include "nspack/doccrypt.hpp"
#include "nspack/error.hpp"
#include "nspack/templates.hpp"

#include <limits>
#include <string>
#include <utility>

namespace nspack::payload {

void PadToBlock(Bytes& data) {
    const std::size_t remainder = data.size() % constants::kBlockSize;
    if (remainder != 0) {
        data.resize(data.size() + (constants::kBlockSize - remainder), 0);
    }
}

Bytes ProtectPayload(const Bytes& templated) {
    Bytes body = deflate::Compress(templated);
    cli::LogStage("compressed " + std::to_string(templated.size()) + " -> " + std::to_string(body.size())
                  + " bytes");
    PadToBlock(body);
    doccrypt::Protect(body);
    cli::LogStage("protected " + std::to_string(body.size()) + " bytes");

    Bytes out = templates::ProtectedHeader();
    crypto::detail::AppendBytes(out, body);
    return out;
}

tns::Entry ProtectedEntry(std::string name, const Bytes& templated) {
    return tns::Entry::Protected(std::move(name), ProtectPayload(templated));
}

tns::Entry CompanionEntry(std::string name, const Bytes& content) {
    if (content.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw Error(ErrorKind::InvalidInput, "Companion file too large: " + name);
    }
    Bytes compressed = deflate::Compress(content);
    cli::LogStage("companion " + name + ": " + std::to_string(content.size()) + " -> "
                  + std::to_string(compressed.size()) + " bytes");
    const auto original_size = static_cast<std::uint32_t>(content.size());
    const std::uint32_t crc = deflate::Crc32(content);
    return tns::Entry::Deflated(std::move(name), std::move(compressed), original_size, crc);
}

}  // namespace nspack::payload

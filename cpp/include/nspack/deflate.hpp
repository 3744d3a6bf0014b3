#pragma once

#include <cstdint>
#include <vector>

namespace nspack::deflate {

using Bytes = std::vector<std::uint8_t>;

// Raw deflate (no zlib or gzip wrapper) at the library default level.
Bytes Compress(const Bytes& input);
Bytes Decompress(const Bytes& input);

std::uint32_t Crc32(const Bytes& data);

}  // namespace nspack::deflate

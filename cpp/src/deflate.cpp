#include "nspack/deflate.hpp"

#include "nspack/error.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

#include <zlib.h>

namespace nspack::deflate {

namespace {

constexpr int kRawWindowBits = -15;
constexpr int kMemLevel = 8;
constexpr std::size_t kChunkSize = 1u << 14;

void EnsureFits(const Bytes& input, ErrorKind kind) {
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw Error(kind, "Input too large for a single deflate call");
    }
}

}  // namespace

Bytes Compress(const Bytes& input) {
    EnsureFits(input, ErrorKind::CompressionFailed);
    z_stream zs{};
    int rc = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kRawWindowBits, kMemLevel,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw Error(ErrorKind::CompressionFailed,
                    "Failed to initialize deflate (zlib code " + std::to_string(rc) + ")");
    }
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    Bytes out;
    out.reserve(deflateBound(&zs, static_cast<uLong>(input.size())));
    std::array<std::uint8_t, kChunkSize> buffer{};
    do {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = ::deflate(&zs, Z_FINISH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            deflateEnd(&zs);
            throw Error(ErrorKind::CompressionFailed,
                        "Deflate failed (zlib code " + std::to_string(rc) + ")");
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    } while (rc != Z_STREAM_END);
    deflateEnd(&zs);
    return out;
}

Bytes Decompress(const Bytes& input) {
    EnsureFits(input, ErrorKind::DecompressionFailed);
    z_stream zs{};
    int rc = inflateInit2(&zs, kRawWindowBits);
    if (rc != Z_OK) {
        throw Error(ErrorKind::DecompressionFailed,
                    "Failed to initialize inflate (zlib code " + std::to_string(rc) + ")");
    }
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    Bytes out;
    std::array<std::uint8_t, kChunkSize> buffer{};
    rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw Error(ErrorKind::DecompressionFailed,
                        "Inflate failed (zlib code " + std::to_string(rc) + ")");
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        if (rc == Z_OK && produced == 0 && zs.avail_in == 0) {
            inflateEnd(&zs);
            throw Error(ErrorKind::DecompressionFailed, "Truncated deflate stream");
        }
    }
    inflateEnd(&zs);
    return out;
}

std::uint32_t Crc32(const Bytes& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const Bytef* cursor = reinterpret_cast<const Bytef*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(std::min<std::size_t>(remaining, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, cursor, chunk);
        cursor += chunk;
        remaining -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

}  // namespace nspack::deflate

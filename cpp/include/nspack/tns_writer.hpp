#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nspack::tns {

using Bytes = std::vector<std::uint8_t>;

enum class Method : std::uint16_t {
    VendorProtected = 0x0D,
    Deflated = 0x08
};

// Selects the 4-byte version tag of the first local header; the layout is
// otherwise identical.
enum class FormatVersion {
    Default,
    Bitmap
};

struct Entry {
    std::string name;
    Bytes body;
    Method method = Method::VendorProtected;
    // Unset: the stored body length is used.
    std::optional<std::uint32_t> uncompressed_size;
    // Unset: CRC-32 of the stored body is used.
    std::optional<std::uint32_t> crc32;

    static Entry Protected(std::string name, Bytes body);
    static Entry Deflated(std::string name, Bytes compressed, std::uint32_t original_size, std::uint32_t crc);
};

std::string_view VersionTag(FormatVersion version);

// Serializes entries in order. Entry 0 gets the vendor local header, the
// rest get standard local headers; the directory ends with the vendor
// end record. Throws Error(ArchiveWriteFailed) when a field overflows.
Bytes BuildArchive(const std::vector<Entry>& entries, FormatVersion version = FormatVersion::Default);

// BuildArchive followed by a single write to path.
void WriteArchive(const std::filesystem::path& path,
                  const std::vector<Entry>& entries,
                  FormatVersion version = FormatVersion::Default);

}  // namespace nspack::tns

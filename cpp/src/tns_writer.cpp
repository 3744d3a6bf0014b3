#include "nspack/tns_writer.hpp"

#include "nspack/constants.hpp"
#include "nspack/deflate.hpp"
#include "nspack/error.hpp"
#include "nspack/nspack.hpp"

#include <limits>
#include <string>
#include <utility>

namespace nspack::tns {

namespace {

enum class HeaderKind {
    First,
    Subsequent
};

struct WrittenEntry {
    std::string name;
    std::uint16_t method = 0;
    std::uint32_t crc32 = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_header_offset = 0;
};

constexpr std::uint64_t kMaxU16 = std::numeric_limits<std::uint16_t>::max();
constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

void WriteU16LE(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void WriteU32LE(Bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void WriteText(Bytes& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

std::size_t LocalHeaderLen(HeaderKind kind) {
    return kind == HeaderKind::First ? constants::kVendorLocalHeaderLen : constants::kLocalHeaderLen;
}

// Total serialized size; throws when a count, length or offset overflows
// its 16/32-bit field.
std::uint64_t CheckedArchiveSize(const std::vector<Entry>& entries) {
    if (entries.size() > kMaxU16) {
        throw Error(ErrorKind::ArchiveWriteFailed,
                    "Too many archive entries: " + std::to_string(entries.size()));
    }
    std::uint64_t total = constants::kEndRecordLen;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];
        if (entry.name.size() > kMaxU16) {
            throw Error(ErrorKind::ArchiveWriteFailed, "Archive entry name too long");
        }
        if (entry.body.size() > kMaxU32) {
            throw Error(ErrorKind::ArchiveWriteFailed, "Archive entry too large: " + entry.name);
        }
        HeaderKind kind = i == 0 ? HeaderKind::First : HeaderKind::Subsequent;
        total += LocalHeaderLen(kind) + entry.name.size() + entry.body.size();
        total += constants::kCentralDirRecordLen + entry.name.size();
    }
    if (total > kMaxU32) {
        throw Error(ErrorKind::ArchiveWriteFailed, "Archive exceeds 32-bit offsets");
    }
    return total;
}

void WriteLocalHeader(Bytes& out, HeaderKind kind, const WrittenEntry& entry, FormatVersion version) {
    if (kind == HeaderKind::First) {
        WriteText(out, constants::kVendorMagic);
        WriteText(out, VersionTag(version));
    } else {
        WriteU32LE(out, constants::kLocalHeaderSig);
    }
    WriteU16LE(out, constants::kVersionNeeded);
    WriteU16LE(out, 0);  // flags
    WriteU16LE(out, entry.method);
    WriteU32LE(out, constants::kDosDateTime);
    WriteU32LE(out, entry.crc32);
    WriteU32LE(out, entry.compressed_size);
    WriteU32LE(out, entry.uncompressed_size);
    WriteU16LE(out, static_cast<std::uint16_t>(entry.name.size()));
    WriteU16LE(out, 0);  // extra field
    WriteText(out, entry.name);
}

void WriteCentralDirRecord(Bytes& out, const WrittenEntry& entry) {
    WriteU32LE(out, constants::kCentralDirSig);
    WriteU16LE(out, constants::kVersionMadeBy);
    WriteU16LE(out, constants::kVersionNeeded);
    WriteU16LE(out, 0);  // flags
    WriteU16LE(out, entry.method);
    WriteU32LE(out, constants::kDosDateTime);
    WriteU32LE(out, entry.crc32);
    WriteU32LE(out, entry.compressed_size);
    WriteU32LE(out, entry.uncompressed_size);
    WriteU16LE(out, static_cast<std::uint16_t>(entry.name.size()));
    WriteU16LE(out, 0);  // extra field
    WriteU16LE(out, 0);  // comment
    WriteU16LE(out, 0);  // disk number start
    WriteU16LE(out, 0);  // internal attributes
    WriteU32LE(out, 0);  // external attributes
    WriteU32LE(out, entry.local_header_offset);
    WriteText(out, entry.name);
}

void WriteEndRecord(Bytes& out, std::uint16_t count, std::uint32_t dir_size, std::uint32_t dir_offset) {
    WriteText(out, constants::kVendorEndSig);
    WriteU16LE(out, 0);  // this disk
    WriteU16LE(out, 0);  // directory disk
    WriteU16LE(out, count);
    WriteU16LE(out, count);
    WriteU32LE(out, dir_size);
    WriteU32LE(out, dir_offset);
    WriteU16LE(out, 0);  // comment
}

}  // namespace

Entry Entry::Protected(std::string name, Bytes body) {
    Entry entry;
    entry.name = std::move(name);
    entry.body = std::move(body);
    entry.method = Method::VendorProtected;
    return entry;
}

Entry Entry::Deflated(std::string name, Bytes compressed, std::uint32_t original_size, std::uint32_t crc) {
    Entry entry;
    entry.name = std::move(name);
    entry.body = std::move(compressed);
    entry.method = Method::Deflated;
    entry.uncompressed_size = original_size;
    entry.crc32 = crc;
    return entry;
}

std::string_view VersionTag(FormatVersion version) {
    return version == FormatVersion::Bitmap ? constants::kVersionBitmap : constants::kVersionDefault;
}

Bytes BuildArchive(const std::vector<Entry>& entries, FormatVersion version) {
    const std::uint64_t total = CheckedArchiveSize(entries);
    Bytes out;
    out.reserve(static_cast<std::size_t>(total));

    std::vector<WrittenEntry> written;
    written.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];
        WrittenEntry record;
        record.name = entry.name;
        record.method = static_cast<std::uint16_t>(entry.method);
        record.compressed_size = static_cast<std::uint32_t>(entry.body.size());
        record.uncompressed_size = entry.uncompressed_size.value_or(record.compressed_size);
        record.crc32 = entry.crc32 ? *entry.crc32 : deflate::Crc32(entry.body);
        record.local_header_offset = static_cast<std::uint32_t>(out.size());

        WriteLocalHeader(out, i == 0 ? HeaderKind::First : HeaderKind::Subsequent, record, version);
        out.insert(out.end(), entry.body.begin(), entry.body.end());
        written.push_back(std::move(record));
    }

    const auto dir_offset = static_cast<std::uint32_t>(out.size());
    for (const auto& record : written) {
        WriteCentralDirRecord(out, record);
    }
    const auto dir_size = static_cast<std::uint32_t>(out.size() - dir_offset);
    WriteEndRecord(out, static_cast<std::uint16_t>(written.size()), dir_size, dir_offset);
    return out;
}

void WriteArchive(const std::filesystem::path& path, const std::vector<Entry>& entries, FormatVersion version) {
    Bytes archive = BuildArchive(entries, version);
    WriteFile(path, archive);
}

}  // namespace nspack::tns

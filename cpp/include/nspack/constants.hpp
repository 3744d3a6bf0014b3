#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace nspack::constants {

// Archive layout
inline constexpr std::string_view kVendorMagic = "*TIMLP";
inline constexpr std::string_view kVersionDefault = "0500";
inline constexpr std::string_view kVersionBitmap = "0700";
inline constexpr std::string_view kVendorEndSig = "TIPD";
inline constexpr std::uint32_t kLocalHeaderSig = 0x04034b50u;
inline constexpr std::uint32_t kCentralDirSig = 0x02014b50u;

inline constexpr std::uint16_t kMethodVendorProtected = 0x0D;
inline constexpr std::uint16_t kMethodDeflated = 0x08;
inline constexpr std::uint16_t kVersionNeeded = 20;
inline constexpr std::uint16_t kVersionMadeBy = 20;
inline constexpr std::uint32_t kDosDateTime = 0x00200000u;

inline constexpr std::size_t kVendorLocalHeaderLen = 36;
inline constexpr std::size_t kLocalHeaderLen = 30;
inline constexpr std::size_t kCentralDirRecordLen = 46;
inline constexpr std::size_t kEndRecordLen = 22;

inline constexpr std::string_view kDocumentEntryName = "Document.xml";
inline constexpr std::string_view kProblemEntryName = "Problem1.xml";
inline constexpr std::size_t kMaxCompanionNameLen = 240;

// Document keystream
inline constexpr std::size_t kBlockSize = 8;
inline constexpr std::uint32_t kIvecBase = 0x6fe21307u;
inline constexpr std::uint32_t kCounterWrap = 1024;

inline constexpr std::array<std::uint8_t, 24> kDocumentKey = {
    0x16, 0xA7, 0xA7, 0x32, 0x68, 0xA7, 0xBA, 0x73,
    0xD9, 0xA8, 0x86, 0xA4, 0x34, 0x45, 0x94, 0x10,
    0x3D, 0x80, 0x8C, 0xB5, 0xDF, 0xB3, 0x80, 0x6B,
};

// Environment switches
inline constexpr std::string_view kEnvVerbose = "NSPACK_VERBOSE";
inline constexpr std::string_view kEnvNoColor = "NSPACK_NO_COLOR";

inline constexpr std::string_view kEngineVersion = "1.0.0";

}  // namespace nspack::constants

#pragma once

#include "nspack/tns_writer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace nspack::payload {

using Bytes = std::vector<std::uint8_t>;

// Appends zero bytes up to the next multiple of the cipher block size.
void PadToBlock(Bytes& data);

// compress -> pad -> protect -> prepend the vendor header.
Bytes ProtectPayload(const Bytes& templated);

tns::Entry ProtectedEntry(std::string name, const Bytes& templated);

// Raw-deflated entry carrying the original size and the CRC-32 of the
// original (not the compressed) bytes.
tns::Entry CompanionEntry(std::string name, const Bytes& content);

}  // namespace nspack::payload

#pragma once

#include <cstdint>
#include <vector>

namespace nspack::doccrypt {

using Bytes = std::vector<std::uint8_t>;

// XORs the document keystream into data in place. Block i is masked with
// 3DES-ECB(00 00 00 00 || LE32(kIvecBase + (i mod 1024))) under the fixed
// document key. Applying it twice restores the input.
// Throws Error(InvalidBlockLength) when data.size() is not a multiple of 8;
// data is left untouched in that case.
void Protect(Bytes& data);

}  // namespace nspack::doccrypt

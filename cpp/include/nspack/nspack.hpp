#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "nspack/constants.hpp"
#include "nspack/converter.hpp"
#include "nspack/error.hpp"
#include "nspack/tns_writer.hpp"

namespace nspack {

std::vector<std::uint8_t> ReadFile(const std::filesystem::path& path);

// One write call; a failed write removes whatever reached the disk.
void WriteFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

}  // namespace nspack

#include "nspack/nspack.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace nspack {

std::vector<std::uint8_t> ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw Error(ErrorKind::Io, "Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw Error(ErrorKind::Io, "Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw Error(ErrorKind::Io, "Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw Error(ErrorKind::Io, "Failed to open output: " + path.string());
    }
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    output.close();
    if (!output) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw Error(ErrorKind::Io, "Failed to write output: " + path.string());
    }
}

}  // namespace nspack

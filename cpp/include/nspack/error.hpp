#pragma once

#include <stdexcept>
#include <string>

namespace nspack {

enum class ErrorKind {
    InvalidBlockLength,
    CompressionFailed,
    DecompressionFailed,
    Io,
    InvalidInput,
    ArchiveWriteFailed
};

const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace nspack

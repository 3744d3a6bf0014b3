#include "nspack/error.hpp"

namespace nspack {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidBlockLength:
            return "invalid-block-length";
        case ErrorKind::CompressionFailed:
            return "compression-failed";
        case ErrorKind::DecompressionFailed:
            return "decompression-failed";
        case ErrorKind::Io:
            return "io";
        case ErrorKind::InvalidInput:
            return "invalid-input";
        case ErrorKind::ArchiveWriteFailed:
            return "archive-write-failed";
    }
    return "unknown";
}

}  // namespace nspack

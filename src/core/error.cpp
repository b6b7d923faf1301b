#include "puaa/error.hpp"

namespace puaa {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                   return "Success";
        case ErrorCode::INVALID_ARGUMENT:          return "InvalidArgument";
        case ErrorCode::MALFORMED_SOURCE:          return "MalformedSource";
        case ErrorCode::CONFLICTING_RANGE:         return "ConflictingRange";
        case ErrorCode::UNSUPPORTED_VERSION:       return "UnsupportedVersion";
        case ErrorCode::CORRUPT_TABLE:             return "CorruptTable";
        case ErrorCode::UNSUPPORTED_CONTAINER:     return "UnsupportedContainer";
        case ErrorCode::TABLE_TOO_LARGE:           return "TableTooLarge";
        case ErrorCode::CHECKSUM_MISMATCH_ON_READ: return "ChecksumMismatchOnRead";
        case ErrorCode::FILE_NOT_FOUND:            return "FileNotFound";
        case ErrorCode::WRITE_FAILED:              return "WriteFailed";
    }
    return "Unknown";
}

} // namespace puaa

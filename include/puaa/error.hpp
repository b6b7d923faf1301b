#pragma once

#include <stdexcept>
#include <string>

namespace puaa {

/**
 * Structured error reporting for the table compiler.
 * Every failure carries a code, a context (file:line, offset or range)
 * and an optional suggestion for the user.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Source text errors
    MALFORMED_SOURCE = 100,
    CONFLICTING_RANGE = 101,

    // Compiled table errors
    UNSUPPORTED_VERSION = 200,
    CORRUPT_TABLE = 201,

    // Font container errors
    UNSUPPORTED_CONTAINER = 300,
    TABLE_TOO_LARGE = 301,
    CHECKSUM_MISMATCH_ON_READ = 302,

    // I/O errors
    FILE_NOT_FOUND = 400,
    WRITE_FAILED = 401
};

const char* error_code_name(ErrorCode code) noexcept;

class PuaaException : public std::runtime_error {
public:
    explicit PuaaException(ErrorCode code, const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types

class InvalidArgumentError : public PuaaException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : PuaaException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Bad input text. Context is "file:line".
class MalformedSourceError : public PuaaException {
public:
    MalformedSourceError(const std::string& message, const std::string& file, size_t line)
        : PuaaException(ErrorCode::MALFORMED_SOURCE, message,
                        line ? file + ":" + std::to_string(line) : file)
        , file_(file)
        , line_(line) {}

    const std::string& file() const noexcept { return file_; }
    size_t line() const noexcept { return line_; }

private:
    std::string file_;
    size_t line_;
};

// Two sources disagree on a partial range overlap. Context names both sides.
class ConflictingRangeError : public PuaaException {
public:
    ConflictingRangeError(const std::string& message, const std::string& first_location,
                          const std::string& second_location)
        : PuaaException(ErrorCode::CONFLICTING_RANGE, message,
                        first_location + " vs " + second_location,
                        "ranges from different sources must be disjoint or identical")
        , first_location_(first_location)
        , second_location_(second_location) {}

    const std::string& first_location() const noexcept { return first_location_; }
    const std::string& second_location() const noexcept { return second_location_; }

private:
    std::string first_location_;
    std::string second_location_;
};

class UnsupportedVersionError : public PuaaException {
public:
    explicit UnsupportedVersionError(const std::string& message, const std::string& context = "")
        : PuaaException(ErrorCode::UNSUPPORTED_VERSION, message, context,
                        "rebuild the table with this release of puaa") {}
};

class CorruptTableError : public PuaaException {
public:
    explicit CorruptTableError(const std::string& message, const std::string& context = "")
        : PuaaException(ErrorCode::CORRUPT_TABLE, message, context) {}
};

class UnsupportedContainerError : public PuaaException {
public:
    explicit UnsupportedContainerError(const std::string& message, const std::string& context = "")
        : PuaaException(ErrorCode::UNSUPPORTED_CONTAINER, message, context) {}
};

class TableTooLargeError : public PuaaException {
public:
    explicit TableTooLargeError(const std::string& message, const std::string& context = "")
        : PuaaException(ErrorCode::TABLE_TOO_LARGE, message, context) {}
};

class ChecksumMismatchError : public PuaaException {
public:
    explicit ChecksumMismatchError(const std::string& message, const std::string& context = "")
        : PuaaException(ErrorCode::CHECKSUM_MISMATCH_ON_READ, message, context,
                        "the font is damaged; repair it with a font editor first") {}
};

class IOError : public PuaaException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : PuaaException(code, message, context) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw PuaaException(code, message, context, suggestion);
        }
    }
};

// Context names what was being processed: a file, a table or a target
#define PUAA_CHECK(condition, code, message, context) \
    puaa::ErrorHandler::check_condition(condition, code, message, context)

#define PUAA_CHECK_ARGUMENT(condition, message, context) \
    PUAA_CHECK(condition, puaa::ErrorCode::INVALID_ARGUMENT, message, context)

} // namespace puaa

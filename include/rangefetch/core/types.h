#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace rangefetch {

// Type aliases
using Hash = std::string; // lower-case hex digest

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    ServerError,
    ClientError,
    RangeNotSupported,
    TruncatedTransfer,
    SizeMismatch,
    DigestMismatch,
    FileNotFound,
    IoError,
    PermissionDenied,
    StorageFull,
    OperationCancelled,
    ExtractionFailed,
    InvalidData,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::ClientError: return "Client error";
        case ErrorCode::RangeNotSupported: return "Server does not honor range requests";
        case ErrorCode::TruncatedTransfer: return "Truncated transfer";
        case ErrorCode::SizeMismatch: return "Size mismatch";
        case ErrorCode::DigestMismatch: return "Digest mismatch";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::StorageFull: return "Storage full";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ExtractionFailed: return "Extraction failed";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Failures a segment may retry locally before surfacing them to the coordinator.
constexpr bool isRetryable(ErrorCode error) {
    switch (error) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
        case ErrorCode::TruncatedTransfer:
            return true;
        default:
            return false;
    }
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace rangefetch

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<rangefetch::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(rangefetch::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", rangefetch::errorToString(error));
    }
};
#endif

namespace rangefetch {

// Common constants
inline constexpr std::size_t MD5_DIGEST_SIZE = 16;        // bytes
inline constexpr std::size_t MD5_STRING_SIZE = 32;        // hex encoded
inline constexpr std::size_t DEFAULT_WORKER_COUNT = 4;
inline constexpr std::size_t DEFAULT_WRITE_BUFFER_SIZE = 8 * 1024 * 1024;  // 8MB
inline constexpr std::size_t DEFAULT_MERGE_BUFFER_SIZE = 32 * 1024 * 1024; // 32MB
inline constexpr std::size_t DEFAULT_HASH_READ_SIZE = 1024 * 1024;         // 1MB

} // namespace rangefetch

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mlget {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    ManifestInvalid,
    MissingSizeForPieces,
    ChunkCountMismatch,
    NoUrlsAvailable,
    NoLocationSpecified,
    NetworkError,
    Timeout,
    TlsError,
    ServerError,
    HttpError,
    InvalidData,
    ChecksumMismatch,
    FilesystemError,
    UnsupportedAlgorithm,
    OperationCancelled,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ManifestInvalid: return "Invalid manifest";
        case ErrorCode::MissingSizeForPieces: return "File size is required when having pieces";
        case ErrorCode::ChunkCountMismatch: return "Chunk count does not match piece hash count";
        case ErrorCode::NoUrlsAvailable: return "File urls should not be empty";
        case ErrorCode::NoLocationSpecified: return "File has no url location";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::TlsError: return "TLS error";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::ChecksumMismatch: return "Checksum verification failed";
        case ErrorCode::FilesystemError: return "Filesystem error";
        case ErrorCode::UnsupportedAlgorithm: return "Unsupported hash algorithm";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information. Path, url and offset are attached
// where the failure concerns a specific target file or byte range.
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::filesystem::path> path;
    std::optional<std::string> url;
    std::optional<std::uint64_t> offset;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    Error& withPath(std::filesystem::path p) {
        path = std::move(p);
        return *this;
    }

    Error& withUrl(std::string u) {
        url = std::move(u);
        return *this;
    }

    Error& withOffset(std::uint64_t o) {
        offset = o;
        return *this;
    }

    // "message [path=..., url=..., offset=...]"
    std::string describe() const {
        std::string out = message.empty() ? std::string(errorToString(code)) : message;
        std::string ctx;
        auto append = [&ctx](const std::string& kv) {
            if (!ctx.empty())
                ctx += ", ";
            ctx += kv;
        };
        if (path)
            append("path=" + path->string());
        if (url)
            append("url=" + *url);
        if (offset)
            append("offset=" + std::to_string(*offset));
        if (!ctx.empty())
            out += " [" + ctx + "]";
        return out;
    }

    // Comparison operators for ErrorCode
    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    // Friend operators for ErrorCode on the left side
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

    T& value() & {
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

// Common constants
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace mlget

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<mlget::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(mlget::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", mlget::errorToString(error));
    }
};

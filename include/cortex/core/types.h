#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace cortex {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using ItemId = int64_t;
using Embedding = std::vector<float>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidQuery,
    ValidationError,
    NotFound,
    AlreadyExists,
    Conflict,
    EmbeddingUnavailable,
    StoreUnavailable,
    DatabaseError,
    OperationCancelled,
    Timeout,
    InvalidState,
    InternalError,
    NotInitialized,
    NotSupported,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidQuery: return "Invalid query";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Conflict: return "Concurrent modification conflict";
        case ErrorCode::EmbeddingUnavailable: return "Embedding unavailable";
        case ErrorCode::StoreUnavailable: return "Store unavailable";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
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

// Result type for operations that can fail
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
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
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
            throw std::runtime_error("Result contains error: " + error_.message);
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

} // namespace cortex

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<cortex::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(cortex::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", cortex::errorToString(error));
    }
};
#endif

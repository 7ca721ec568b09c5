#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace hybridstore {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Embedding = std::vector<float>;

// Error types
enum class ErrorCode {
    Success = 0,
    DimensionMismatch,
    EmbeddingError,
    NotFound,
    Timeout,
    FilterError,
    ValidationError,
    AlreadyExists,
    DatabaseError,
    InvalidState,
    NotInitialized,
    NotSupported,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::DimensionMismatch:
            return "Dimension mismatch";
        case ErrorCode::EmbeddingError:
            return "Embedding error";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::FilterError:
            return "Invalid metadata filter";
        case ErrorCode::ValidationError:
            return "Validation error";
        case ErrorCode::AlreadyExists:
            return "Already exists";
        case ErrorCode::DatabaseError:
            return "Database error";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::NotInitialized:
            return "Not initialized";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Whether a caller may retry the whole operation after this error.
 *
 * Validation, dimension, filter and not-found errors are deterministic and never retryable.
 */
constexpr bool isRetryable(ErrorCode error) {
    switch (error) {
        case ErrorCode::Timeout:
        case ErrorCode::EmbeddingError:
        case ErrorCode::DatabaseError:
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

} // namespace hybridstore

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<hybridstore::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(hybridstore::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", hybridstore::errorToString(error));
    }
};

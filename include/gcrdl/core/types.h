#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace gcrdl {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NotFound,
    PermissionDenied,
    Unauthorized,
    RateLimited,
    NetworkError,
    Timeout,
    ServerError,
    IoError,
    StorageFull,
    NotSupported,
    PolicyViolation,
    OperationCancelled,
    OperationInProgress,
    NothingSelected,
    NothingMatched,
    AuthCancelled,
    AuthConfigError,
    InvalidState,
    InvalidData,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::StorageFull: return "Storage full";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::PolicyViolation: return "Policy violation";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::NothingSelected: return "Nothing selected";
        case ErrorCode::NothingMatched: return "Nothing matched";
        case ErrorCode::AuthCancelled: return "Authorization cancelled";
        case ErrorCode::AuthConfigError: return "Authorization misconfigured";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information. Remote-call failures also carry the
// HTTP status and the raw Retry-After header when the server sent one.
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<int> httpStatus;
    std::optional<std::string> retryAfter;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Throttling and transient transport failures; worth another attempt.
constexpr bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::RateLimited:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
            return true;
        default:
            return false;
    }
}

// Failures that are final for a single item: record and move on, never retry.
constexpr bool isTerminalForItem(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthorized:
        case ErrorCode::PermissionDenied:
        case ErrorCode::NotFound:
        case ErrorCode::NotSupported:
        case ErrorCode::PolicyViolation:
            return true;
        default:
            return false;
    }
}

// Map an HTTP status (non-2xx) onto the error taxonomy.
inline Error errorFromHttpStatus(int status, std::string message,
                                 std::optional<std::string> retryAfter = std::nullopt) {
    ErrorCode code = ErrorCode::Unknown;
    if (status == 401) {
        code = ErrorCode::Unauthorized;
    } else if (status == 403) {
        code = ErrorCode::PermissionDenied;
    } else if (status == 404) {
        code = ErrorCode::NotFound;
    } else if (status == 408) {
        code = ErrorCode::Timeout;
    } else if (status == 429) {
        code = ErrorCode::RateLimited;
    } else if (status >= 500 && status <= 599) {
        code = ErrorCode::ServerError;
    } else if (status >= 400 && status <= 499) {
        code = ErrorCode::InvalidArgument;
    }
    Error err{code, std::move(message)};
    err.httpStatus = status;
    err.retryAfter = std::move(retryAfter);
    return err;
}

// Simple Result type for operations that can fail (compatible with pre-C++23)
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::in_place_type<T>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_type<T>, value) {}
    Result(ErrorCode error) : data_(std::in_place_type<Error>, Error{error}) {}
    Result(Error error) : data_(std::in_place_type<Error>, std::move(error)) {}

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

// Milliseconds since the Unix epoch; the unit every persisted timestamp uses.
inline std::int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(std::int64_t ms) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms))};
}

} // namespace gcrdl

// fmt library support for ErrorCode (for spdlog)
template <> struct fmt::formatter<gcrdl::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(gcrdl::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", gcrdl::errorToString(error));
    }
};

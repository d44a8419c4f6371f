#pragma once

/// @file error.h
/// @brief Guardian error handling utilities using absl::Status
///
/// Every engine fault is an absl::Status. The Guardian-specific ErrorCode is
/// attached as a payload so callers can tell a catalog fault from a strategy
/// fault even when both map onto the same canonical absl code.

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace guardian {

/// @brief Error codes specific to Guardian
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kInternal,

    // Engine faults
    kCatalogLoadError,     ///< Malformed or duplicate catalog entry (fatal at startup)
    kStrategyError,        ///< Defense transformation violated an invariant
    kConfigurationError,   ///< Invalid configuration value

    // Provider failures (recoverable)
    kProviderTimedOut,
    kProviderRateLimited,
    kProviderUnavailable,
    kProviderInvalidResponse,

    // Persistence
    kSerializationError,
    kDeserializationError,
};

/// @brief Payload type URL under which the ErrorCode is stored
inline constexpr char kErrorCodePayloadUrl[] = "type.guardian/error_code";

/// @brief Convert Guardian error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Convert error code to its stable name
std::string ErrorCodeToString(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
///
/// The canonical absl code is derived from @p code and the code itself is
/// attached as a payload.
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the Guardian error code from a status
///
/// Falls back to a best-effort mapping of the canonical code when the status
/// was not produced by MakeError.
ErrorCode GetErrorCode(const absl::Status& status);

inline absl::Status CatalogLoadError(std::string_view message) {
    return MakeError(ErrorCode::kCatalogLoadError, message);
}

inline absl::Status StrategyError(std::string_view message) {
    return MakeError(ErrorCode::kStrategyError, message);
}

inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidArgument, message);
}

/// @brief Create a not found error
inline absl::Status NotFoundError(std::string_view message) {
    return MakeError(ErrorCode::kNotFound, message);
}

bool IsCatalogLoadError(const absl::Status& status);
bool IsStrategyError(const absl::Status& status);
bool IsConfigurationError(const absl::Status& status);

/// @brief True for any of the four provider failure kinds
bool IsProviderError(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define GUARDIAN_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define GUARDIAN_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    GUARDIAN_ASSIGN_OR_RETURN_IMPL(                                            \
        GUARDIAN_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define GUARDIAN_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define GUARDIAN_CONCAT(a, b) GUARDIAN_CONCAT_IMPL(a, b)
#define GUARDIAN_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define GUARDIAN_CHECK_OR_RETURN(condition, error_status)                      \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace guardian

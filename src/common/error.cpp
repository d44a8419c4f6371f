#include "common/error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace guardian {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kCatalogLoadError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
        case ErrorCode::kStrategyError:
        case ErrorCode::kSerializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kDeserializationError:
        case ErrorCode::kProviderInvalidResponse:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kProviderTimedOut:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kProviderRateLimited:
            return absl::StatusCode::kResourceExhausted;
        case ErrorCode::kProviderUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kCatalogLoadError: return "catalog_load_error";
        case ErrorCode::kStrategyError: return "strategy_error";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kProviderTimedOut: return "provider_timed_out";
        case ErrorCode::kProviderRateLimited: return "provider_rate_limited";
        case ErrorCode::kProviderUnavailable: return "provider_unavailable";
        case ErrorCode::kProviderInvalidResponse: return "provider_invalid_response";
        case ErrorCode::kSerializationError: return "serialization_error";
        case ErrorCode::kDeserializationError: return "deserialization_error";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), std::string(message));
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl,
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    if (auto payload = status.GetPayload(kErrorCodePayloadUrl)) {
        int value = 0;
        if (absl::SimpleAtoi(std::string(*payload), &value)) {
            return static_cast<ErrorCode>(value);
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kDeadlineExceeded:
            return ErrorCode::kProviderTimedOut;
        case absl::StatusCode::kResourceExhausted:
            return ErrorCode::kProviderRateLimited;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kProviderUnavailable;
        default:
            return ErrorCode::kUnknown;
    }
}

bool IsCatalogLoadError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kCatalogLoadError;
}

bool IsStrategyError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kStrategyError;
}

bool IsConfigurationError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kConfigurationError;
}

bool IsProviderError(const absl::Status& status) {
    switch (GetErrorCode(status)) {
        case ErrorCode::kProviderTimedOut:
        case ErrorCode::kProviderRateLimited:
        case ErrorCode::kProviderUnavailable:
        case ErrorCode::kProviderInvalidResponse:
            return true;
        default:
            return false;
    }
}

}  // namespace guardian

#pragma once

/// @file provider.h
/// @brief Language-model provider capability consumed by the engine
///
/// Concrete provider clients live outside this repository; the engine only
/// needs Generate() and its failure modes.

#include <chrono>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "common/error.h"

namespace guardian::provider {

/// @brief Abstract language-model backend
class Provider {
public:
    virtual ~Provider() = default;

    /// @brief Generate a response for a prompt
    /// @return The response text, or a provider error (see ProviderTimedOut
    ///         and friends below)
    virtual absl::StatusOr<std::string> Generate(const std::string& prompt,
                                                 std::chrono::milliseconds timeout) = 0;

    /// @brief Provider name used in logs
    virtual std::string Name() const = 0;
};

// Provider failure kinds. All of them are recoverable: the engine scores
// without a provider outcome.

inline absl::Status ProviderTimedOut(std::string_view message) {
    return MakeError(ErrorCode::kProviderTimedOut, message);
}

inline absl::Status ProviderRateLimited(std::string_view message) {
    return MakeError(ErrorCode::kProviderRateLimited, message);
}

inline absl::Status ProviderUnavailable(std::string_view message) {
    return MakeError(ErrorCode::kProviderUnavailable, message);
}

inline absl::Status ProviderInvalidResponse(std::string_view message) {
    return MakeError(ErrorCode::kProviderInvalidResponse, message);
}

}  // namespace guardian::provider

#pragma once

/// @file echo_provider.h
/// @brief Offline provider that answers with the prompt it receives

#include <chrono>
#include <string>

#include "provider/provider.h"

namespace guardian::provider {

/// @brief Configuration for EchoProvider
struct EchoProviderConfig {
    /// Simulated generation latency
    std::chrono::milliseconds delay{0};

    /// Text prepended to the echoed prompt
    std::string response_prefix;
};

/// @brief Provider used by the CLI demo and tests
///
/// Honors the caller's timeout: when @ref EchoProviderConfig::delay exceeds
/// it, Generate sleeps for the timeout and returns ProviderTimedOut.
class EchoProvider : public Provider {
public:
    explicit EchoProvider(EchoProviderConfig config = {});

    absl::StatusOr<std::string> Generate(const std::string& prompt,
                                         std::chrono::milliseconds timeout) override;

    std::string Name() const override { return "echo"; }

private:
    EchoProviderConfig config_;
};

}  // namespace guardian::provider

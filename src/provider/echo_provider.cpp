/// @file echo_provider.cpp
/// @brief Offline echo provider

#include "provider/echo_provider.h"

#include <thread>

#include <absl/strings/str_cat.h>

namespace guardian::provider {

EchoProvider::EchoProvider(EchoProviderConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<std::string> EchoProvider::Generate(
    const std::string& prompt,
    std::chrono::milliseconds timeout) {
    if (config_.delay > timeout) {
        std::this_thread::sleep_for(timeout);
        return ProviderTimedOut(absl::StrCat(
            "echo provider needs ", config_.delay.count(), "ms, timeout is ",
            timeout.count(), "ms"));
    }
    if (config_.delay.count() > 0) {
        std::this_thread::sleep_for(config_.delay);
    }
    return absl::StrCat(config_.response_prefix, prompt);
}

}  // namespace guardian::provider

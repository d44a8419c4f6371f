#pragma once

/// @file provider_executor.h
/// @brief Bounded-wait provider calls on dedicated threads
///
/// Provider calls are slow and may never return, so they do not share the
/// engine's worker pool. Each call runs on its own detached thread; the
/// caller waits until a deadline fixed when the call starts. A call that
/// misses its deadline keeps running in the background and still counts
/// against max_in_flight until the provider returns.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "provider/provider.h"

namespace guardian::provider {

/// @brief Configuration for ProviderExecutor
struct ProviderExecutorConfig {
    /// Calls allowed to run at once, abandoned ones included
    size_t max_in_flight = 16;

    /// How long shutdown waits for running calls before leaving them behind
    std::chrono::milliseconds shutdown_grace{1000};
};

/// @brief Handle to one started provider call
class PendingCall {
public:
    /// @brief Block until the response arrives or the deadline passes
    /// @return The provider's result, or ProviderTimedOut after the deadline
    absl::StatusOr<std::string> Wait() const;

private:
    friend class ProviderExecutor;

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        absl::StatusOr<std::string> result;
    };

    explicit PendingCall(absl::Status rejected) : rejected_(std::move(rejected)) {}
    PendingCall(std::shared_ptr<State> state,
                std::chrono::steady_clock::time_point deadline,
                std::chrono::milliseconds timeout)
        : state_(std::move(state)), deadline_(deadline), timeout_(timeout) {}

    std::shared_ptr<State> state_;
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::milliseconds timeout_{0};
    std::optional<absl::Status> rejected_;
};

/// @brief Runs provider calls with a deadline measured from the call start
///
/// Example:
/// @code
///   ProviderExecutor executor;
///   auto response = executor.Call(provider, prompt, std::chrono::seconds(5));
///   if (!response.ok() && IsProviderError(response.status())) {
///       // scored without a provider outcome
///   }
/// @endcode
class ProviderExecutor {
public:
    explicit ProviderExecutor(ProviderExecutorConfig config = {});

    /// Calls Shutdown()
    ~ProviderExecutor();

    // Disable copy and move
    ProviderExecutor(const ProviderExecutor&) = delete;
    ProviderExecutor& operator=(const ProviderExecutor&) = delete;
    ProviderExecutor(ProviderExecutor&&) = delete;
    ProviderExecutor& operator=(ProviderExecutor&&) = delete;

    /// @brief Start a call; the deadline is now + @p timeout
    ///
    /// The returned call fails with ProviderUnavailable when max_in_flight
    /// calls are already running, the executor is shut down, or no thread
    /// could be started.
    PendingCall Start(std::shared_ptr<Provider> provider,
                      std::string prompt,
                      std::chrono::milliseconds timeout);

    /// @brief Start(...).Wait()
    absl::StatusOr<std::string> Call(std::shared_ptr<Provider> provider,
                                     std::string prompt,
                                     std::chrono::milliseconds timeout);

    /// @brief Reject new calls and wait up to shutdown_grace for running ones
    ///
    /// Calls still running afterwards are left to finish on their own; they
    /// hold their provider and never touch the executor.
    void Shutdown();

    /// @brief Calls whose provider has not returned yet
    size_t InFlight() const;

    const ProviderExecutorConfig& GetConfig() const { return config_; }

private:
    // Shared with the call threads, which may outlive the executor
    struct Tracker {
        std::mutex mutex;
        std::condition_variable idle;
        size_t in_flight = 0;
        bool stopping = false;
    };

    ProviderExecutorConfig config_;
    std::shared_ptr<Tracker> tracker_;
};

}  // namespace guardian::provider

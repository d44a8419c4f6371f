/// @file provider_executor.cpp
/// @brief Provider call threads and deadlines

#include "provider/provider_executor.h"

#include <exception>
#include <system_error>
#include <thread>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace guardian::provider {

absl::StatusOr<std::string> PendingCall::Wait() const {
    if (rejected_) {
        return *rejected_;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->cv.wait_until(lock, deadline_, [this] { return state_->done; })) {
        return ProviderTimedOut(absl::StrCat("no response within ", timeout_.count(), "ms"));
    }
    return state_->result;
}

ProviderExecutor::ProviderExecutor(ProviderExecutorConfig config)
    : config_(config), tracker_(std::make_shared<Tracker>()) {}

ProviderExecutor::~ProviderExecutor() {
    Shutdown();
}

PendingCall ProviderExecutor::Start(std::shared_ptr<Provider> provider,
                                    std::string prompt,
                                    std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    {
        std::lock_guard<std::mutex> lock(tracker_->mutex);
        if (tracker_->stopping) {
            return PendingCall(ProviderUnavailable("provider executor is shut down"));
        }
        if (tracker_->in_flight >= config_.max_in_flight) {
            return PendingCall(ProviderUnavailable(absl::StrCat(
                tracker_->in_flight, " provider calls already in flight")));
        }
        ++tracker_->in_flight;
    }

    auto state = std::make_shared<PendingCall::State>();
    try {
        std::thread([tracker = tracker_, state, provider = std::move(provider),
                     prompt = std::move(prompt), timeout]() mutable {
            absl::StatusOr<std::string> result;
            try {
                result = provider->Generate(prompt, timeout);
            } catch (const std::exception& e) {
                result = ProviderUnavailable(e.what());
            }
            provider.reset();

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->result = std::move(result);
                state->done = true;
            }
            state->cv.notify_all();

            {
                std::lock_guard<std::mutex> lock(tracker->mutex);
                --tracker->in_flight;
            }
            tracker->idle.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(tracker_->mutex);
            --tracker_->in_flight;
        }
        tracker_->idle.notify_all();
        GUARDIAN_LOG_ERROR("Cannot start provider call thread: {}", e.what());
        return PendingCall(ProviderUnavailable(
            absl::StrCat("cannot start provider call: ", e.what())));
    }

    return PendingCall(std::move(state), deadline, timeout);
}

absl::StatusOr<std::string> ProviderExecutor::Call(std::shared_ptr<Provider> provider,
                                                   std::string prompt,
                                                   std::chrono::milliseconds timeout) {
    return Start(std::move(provider), std::move(prompt), timeout).Wait();
}

void ProviderExecutor::Shutdown() {
    std::unique_lock<std::mutex> lock(tracker_->mutex);
    if (tracker_->stopping) {
        return;
    }
    tracker_->stopping = true;

    const bool idle = tracker_->idle.wait_for(lock, config_.shutdown_grace, [this] {
        return tracker_->in_flight == 0;
    });
    if (!idle) {
        GUARDIAN_LOG_WARN("{} provider calls still running after {}ms; not waiting for them",
                          tracker_->in_flight, config_.shutdown_grace.count());
    } else {
        GUARDIAN_LOG_DEBUG("Provider executor stopped");
    }
}

size_t ProviderExecutor::InFlight() const {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    return tracker_->in_flight;
}

}  // namespace guardian::provider

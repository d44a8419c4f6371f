/// @file provider_executor_test.cpp
/// @brief Tests for bounded-wait provider calls

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

#include "common/error.h"
#include "provider/echo_provider.h"
#include "provider/provider_executor.h"

namespace guardian::provider {
namespace {

using namespace std::chrono_literals;

// Blocks every Generate call until Release()
class GatedProvider : public Provider {
public:
    GatedProvider() : gate_(released_.get_future().share()) {}

    absl::StatusOr<std::string> Generate(const std::string& prompt,
                                         std::chrono::milliseconds) override {
        ++started_;
        gate_.wait();
        return "late: " + prompt;
    }

    std::string Name() const override { return "gated"; }

    void Release() { released_.set_value(); }
    int Started() const { return started_.load(); }

private:
    std::promise<void> released_;
    std::shared_future<void> gate_;
    std::atomic<int> started_{0};
};

class FailingProvider : public Provider {
public:
    explicit FailingProvider(absl::Status status) : status_(std::move(status)) {}

    absl::StatusOr<std::string> Generate(const std::string&,
                                         std::chrono::milliseconds) override {
        return status_;
    }

    std::string Name() const override { return "failing"; }

private:
    absl::Status status_;
};

class ThrowingProvider : public Provider {
public:
    absl::StatusOr<std::string> Generate(const std::string&,
                                         std::chrono::milliseconds) override {
        throw std::runtime_error("socket closed");
    }

    std::string Name() const override { return "throwing"; }
};

// Waits for detached call threads to finish so no provider outlives the test
void WaitUntilIdle(const ProviderExecutor& executor) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (executor.InFlight() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(executor.InFlight(), 0u);
}

TEST(ProviderExecutorTest, ReturnsResponse) {
    ProviderExecutor executor;
    auto provider = std::make_shared<EchoProvider>();

    auto response = executor.Call(provider, "hello", 1s);
    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_EQ(*response, "hello");
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, ProviderErrorsPassThrough) {
    ProviderExecutor executor;

    auto limited = executor.Call(
        std::make_shared<FailingProvider>(ProviderRateLimited("slow down")), "x", 1s);
    ASSERT_FALSE(limited.ok());
    EXPECT_EQ(GetErrorCode(limited.status()), ErrorCode::kProviderRateLimited);

    auto thrown = executor.Call(std::make_shared<ThrowingProvider>(), "x", 1s);
    ASSERT_FALSE(thrown.ok());
    EXPECT_EQ(GetErrorCode(thrown.status()), ErrorCode::kProviderUnavailable);
    EXPECT_EQ(thrown.status().message(), "socket closed");
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, TimesOutAtDeadline) {
    ProviderExecutor executor;
    auto provider = std::make_shared<GatedProvider>();

    const auto start = std::chrono::steady_clock::now();
    auto response = executor.Call(provider, "x", 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(response.ok());
    EXPECT_EQ(GetErrorCode(response.status()), ErrorCode::kProviderTimedOut);
    EXPECT_EQ(response.status().message(), "no response within 50ms");
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(executor.InFlight(), 1u);

    provider->Release();
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, DeadlineCountsFromStart) {
    ProviderExecutor executor;
    auto provider = std::make_shared<GatedProvider>();

    auto call = executor.Start(provider, "x", 50ms);
    std::this_thread::sleep_for(100ms);

    // The deadline already passed while the caller was busy
    const auto start = std::chrono::steady_clock::now();
    auto response = call.Wait();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 20ms);
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(GetErrorCode(response.status()), ErrorCode::kProviderTimedOut);

    provider->Release();
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, AbandonedCallsDoNotDelayLaterCalls) {
    ProviderExecutor executor;
    auto hung = std::make_shared<GatedProvider>();

    for (int i = 0; i < 4; ++i) {
        auto response = executor.Call(hung, "x", 50ms);
        EXPECT_EQ(GetErrorCode(response.status()), ErrorCode::kProviderTimedOut);
    }
    EXPECT_EQ(hung->Started(), 4);

    const auto start = std::chrono::steady_clock::now();
    auto response = executor.Call(std::make_shared<EchoProvider>(), "fast", 500ms);
    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);

    hung->Release();
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, RejectsBeyondMaxInFlight) {
    ProviderExecutorConfig config;
    config.max_in_flight = 1;
    ProviderExecutor executor(config);
    auto hung = std::make_shared<GatedProvider>();

    auto first = executor.Call(hung, "x", 20ms);
    EXPECT_EQ(GetErrorCode(first.status()), ErrorCode::kProviderTimedOut);

    auto rejected = executor.Call(std::make_shared<EchoProvider>(), "y", 1s);
    ASSERT_FALSE(rejected.ok());
    EXPECT_EQ(GetErrorCode(rejected.status()), ErrorCode::kProviderUnavailable);
    EXPECT_EQ(hung->Started(), 1);

    hung->Release();
    WaitUntilIdle(executor);

    auto accepted = executor.Call(std::make_shared<EchoProvider>(), "y", 1s);
    EXPECT_TRUE(accepted.ok()) << accepted.status();
    WaitUntilIdle(executor);
}

TEST(ProviderExecutorTest, ShutdownIsBoundedByGrace) {
    auto hung = std::make_shared<GatedProvider>();
    ProviderExecutorConfig config;
    config.shutdown_grace = 100ms;

    auto executor = std::make_unique<ProviderExecutor>(config);
    auto call = executor->Start(hung, "x", 10s);

    const auto start = std::chrono::steady_clock::now();
    executor.reset();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);

    // The abandoned call still completes once the provider returns
    hung->Release();
    auto response = call.Wait();
    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_EQ(*response, "late: x");
}

TEST(ProviderExecutorTest, ShutdownWaitsForQuickCalls) {
    ProviderExecutor executor;
    EchoProviderConfig echo_config;
    echo_config.delay = 50ms;
    auto call = executor.Start(std::make_shared<EchoProvider>(echo_config), "x", 1s);

    executor.Shutdown();
    EXPECT_EQ(executor.InFlight(), 0u);
    EXPECT_TRUE(call.Wait().ok());
}

TEST(ProviderExecutorTest, RejectsCallsAfterShutdown) {
    ProviderExecutor executor;
    executor.Shutdown();
    executor.Shutdown();

    auto response = executor.Call(std::make_shared<EchoProvider>(), "x", 1s);
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(GetErrorCode(response.status()), ErrorCode::kProviderUnavailable);
}

}  // namespace
}  // namespace guardian::provider

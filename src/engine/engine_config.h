#pragma once

/// @file engine_config.h
/// @brief Typed engine configuration built from YAML and environment

#include <chrono>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "defense/strategy.h"
#include "detection/detection_result.h"

namespace guardian::engine {

/// @brief Configuration for the defense engine and the CLI around it
struct EngineConfig {
    /// Logging
    LogLevel log_level = LogLevel::kInfo;
    std::string log_file;  ///< Empty = console only

    /// Flagging policy
    detection::DetectionPolicy policy;

    /// Catalog source; empty = built-in catalog
    std::string catalog_path;

    /// Strategies applied by ProcessWithDefaults, in order
    std::vector<defense::StrategyKind> default_strategies = {
        defense::StrategyKind::kSanitize,
        defense::StrategyKind::kWarn,
        defense::StrategyKind::kStructure,
        defense::StrategyKind::kComposite,
    };

    /// Upper bound on the wait for a provider response
    std::chrono::milliseconds provider_timeout{5000};

    /// Provider calls allowed to run at once, including abandoned ones
    size_t provider_max_in_flight = 16;

    /// How long engine shutdown waits for provider calls still running
    std::chrono::milliseconds provider_shutdown_grace{1000};

    /// Also send the undefended prompt to the provider and compare responses
    bool compare_baseline = false;

    /// Worker pool size (0 = hardware concurrency)
    size_t worker_threads = 4;

    /// Where the CLI writes the ledger; empty = not written
    std::string ledger_path;

    static EngineConfig Default() { return EngineConfig{}; }

    /// @brief Build from a generic Config; missing keys keep their defaults
    /// @return ConfigurationError for unknown strategies or categories, a
    ///         threshold outside [0, 1], a non-positive timeout or in-flight
    ///         limit, a negative shutdown grace or an unknown log level
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);

    /// @brief Load a YAML file
    static absl::StatusOr<EngineConfig> LoadFromFile(const std::string& path);

    /// @brief Load a YAML file (if @p path is non-empty) and apply environment
    ///        overrides with the given prefix
    static absl::StatusOr<EngineConfig> LoadWithEnv(
        const std::string& path,
        const std::string& env_prefix = "GUARDIAN_");
};

}  // namespace guardian::engine

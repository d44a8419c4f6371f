/// @file engine_config.cpp
/// @brief Engine configuration parsing and validation

#include "engine/engine_config.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace guardian::engine {

namespace {

const std::vector<EnvBinding>& EnvironmentBindings() {
    static const std::vector<EnvBinding> kBindings = {
        {"LOG_LEVEL", "logging.level"},
        {"LOG_FILE", "logging.file"},
        {"CATALOG_PATH", "catalog.path"},
        {"DETECTION_THRESHOLD", "detection.threshold"},
        {"CRITICAL_CATEGORIES", "detection.critical_categories"},
        {"DEFAULT_STRATEGIES", "defense.default_strategies"},
        {"PROVIDER_TIMEOUT_MS", "provider.timeout_ms"},
        {"PROVIDER_MAX_IN_FLIGHT", "provider.max_in_flight"},
        {"PROVIDER_SHUTDOWN_GRACE_MS", "provider.shutdown_grace_ms"},
        {"PROVIDER_COMPARE_BASELINE", "provider.compare_baseline"},
        {"WORKER_THREADS", "engine.worker_threads"},
        {"LEDGER_PATH", "ledger.path"},
    };
    return kBindings;
}

}  // namespace

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig result;

    // Logging
    GUARDIAN_ASSIGN_OR_RETURN(auto level_name, config.GetString("logging.level"));
    if (level_name) {
        auto level = ParseLogLevel(*level_name);
        if (!level) {
            return ConfigurationError(absl::StrCat("Unknown log level '", *level_name, "'"));
        }
        result.log_level = *level;
    }
    GUARDIAN_ASSIGN_OR_RETURN(auto log_file, config.GetString("logging.file"));
    result.log_file = log_file.value_or(result.log_file);

    // Detection policy
    GUARDIAN_ASSIGN_OR_RETURN(auto threshold, config.GetDouble("detection.threshold"));
    result.policy.threshold = threshold.value_or(result.policy.threshold);
    if (result.policy.threshold < 0.0 || result.policy.threshold > 1.0) {
        return ConfigurationError(absl::StrCat(
            "detection.threshold must be within [0, 1], got ", result.policy.threshold));
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto categories,
                              config.GetStringList("detection.critical_categories"));
    if (categories) {
        result.policy.critical_categories.clear();
        for (const auto& name : *categories) {
            auto category = catalog::ParseCategory(name);
            if (!category) {
                return ConfigurationError(absl::StrCat(
                    "Unknown attack category '", name, "' in detection.critical_categories"));
            }
            result.policy.critical_categories.insert(*category);
        }
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto catalog_path, config.GetString("catalog.path"));
    result.catalog_path = catalog_path.value_or(result.catalog_path);

    // Default strategies
    GUARDIAN_ASSIGN_OR_RETURN(auto strategies,
                              config.GetStringList("defense.default_strategies"));
    if (strategies) {
        result.default_strategies.clear();
        for (const auto& name : *strategies) {
            auto kind = defense::ParseStrategyKind(name);
            if (!kind) {
                std::vector<std::string> known;
                for (auto k : defense::AllStrategyKinds()) {
                    known.push_back(defense::StrategyKindToString(k));
                }
                return ConfigurationError(absl::StrCat(
                    "Unknown defense strategy '", name, "' (expected one of: ",
                    absl::StrJoin(known, ", "), ")"));
            }
            result.default_strategies.push_back(*kind);
        }
        GUARDIAN_CHECK_OR_RETURN(!result.default_strategies.empty(),
            ConfigurationError("defense.default_strategies must not be empty"));
    }

    // Provider
    GUARDIAN_ASSIGN_OR_RETURN(auto timeout_ms, config.GetInt("provider.timeout_ms"));
    if (timeout_ms) {
        if (*timeout_ms <= 0) {
            return ConfigurationError(absl::StrCat(
                "provider.timeout_ms must be positive, got ", *timeout_ms));
        }
        result.provider_timeout = std::chrono::milliseconds(*timeout_ms);
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto max_in_flight, config.GetInt("provider.max_in_flight"));
    if (max_in_flight) {
        if (*max_in_flight <= 0) {
            return ConfigurationError(absl::StrCat(
                "provider.max_in_flight must be positive, got ", *max_in_flight));
        }
        result.provider_max_in_flight = static_cast<size_t>(*max_in_flight);
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto grace_ms, config.GetInt("provider.shutdown_grace_ms"));
    if (grace_ms) {
        if (*grace_ms < 0) {
            return ConfigurationError(absl::StrCat(
                "provider.shutdown_grace_ms must not be negative, got ", *grace_ms));
        }
        result.provider_shutdown_grace = std::chrono::milliseconds(*grace_ms);
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto compare_baseline,
                              config.GetBool("provider.compare_baseline"));
    result.compare_baseline = compare_baseline.value_or(result.compare_baseline);

    // Engine
    GUARDIAN_ASSIGN_OR_RETURN(auto workers, config.GetInt("engine.worker_threads"));
    if (workers) {
        if (*workers < 0) {
            return ConfigurationError(absl::StrCat(
                "engine.worker_threads must not be negative, got ", *workers));
        }
        result.worker_threads = static_cast<size_t>(*workers);
    }

    GUARDIAN_ASSIGN_OR_RETURN(auto ledger_path, config.GetString("ledger.path"));
    result.ledger_path = ledger_path.value_or(result.ledger_path);

    return result;
}

absl::StatusOr<EngineConfig> EngineConfig::LoadFromFile(const std::string& path) {
    return LoadWithEnv(path, "");
}

absl::StatusOr<EngineConfig> EngineConfig::LoadWithEnv(
    const std::string& path,
    const std::string& env_prefix) {
    Config config;
    if (!path.empty()) {
        auto loaded = Config::LoadFromFile(path);
        if (!loaded.ok()) {
            return ConfigurationError(std::string(loaded.status().message()));
        }
        config = std::move(*loaded);
    }

    if (!env_prefix.empty()) {
        config.Overlay(Config::FromEnvironment(env_prefix, EnvironmentBindings()));
    }
    return FromConfig(config);
}

}  // namespace guardian::engine

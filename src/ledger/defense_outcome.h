#pragma once

/// @file defense_outcome.h
/// @brief Record of one strategy application

#include <chrono>
#include <optional>
#include <string>

#include "detection/detection_result.h"
#include "scoring/effectiveness_scorer.h"

namespace guardian::ledger {

using detection::DetectionResult;
using scoring::EffectivenessMetrics;

/// @brief One strategy application, immutable once recorded
struct DefenseOutcome {
    std::string strategy_name;
    DetectionResult original;        ///< Detection of the submitted prompt
    std::string transformed_prompt;  ///< Strategy output
    DetectionResult defended;        ///< Detection of transformed_prompt
    EffectivenessMetrics metrics;
    std::chrono::system_clock::time_point timestamp;

    /// Provider response, when the provider answered in time
    std::optional<std::string> provider_response;

    /// Why the provider outcome is absent (timeout, rate limit, ...)
    std::optional<std::string> provider_error;

    /// Provider response to the original prompt, when baseline comparison
    /// is enabled and the provider answered in time
    std::optional<std::string> baseline_response;

    bool Attempted() const { return metrics.attempted; }
    bool Success() const { return metrics.success; }
    double ConfidenceReduction() const { return metrics.confidence_reduction; }

    bool operator==(const DefenseOutcome& other) const {
        return strategy_name == other.strategy_name && original == other.original &&
               transformed_prompt == other.transformed_prompt &&
               defended == other.defended && metrics == other.metrics &&
               timestamp == other.timestamp &&
               provider_response == other.provider_response &&
               provider_error == other.provider_error &&
               baseline_response == other.baseline_response;
    }
    bool operator!=(const DefenseOutcome& other) const { return !(*this == other); }
};

}  // namespace guardian::ledger

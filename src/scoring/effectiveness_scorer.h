#pragma once

/// @file effectiveness_scorer.h
/// @brief Scores how well a defense neutralized a prompt

#include <memory>
#include <optional>
#include <string_view>

#include "detection/detection_result.h"
#include "detection/detector.h"
#include "scoring/response_analyzer.h"

namespace guardian::scoring {

using detection::DetectionResult;

/// @brief Outcome metrics of one defense application
struct EffectivenessMetrics {
    /// The original prompt was flagged, so there was something to defend
    bool attempted = false;

    /// Defended prompt is no longer flagged; trivially true when !attempted
    bool success = true;

    /// original.confidence - defended.confidence, clamped to [-1, 1]
    double confidence_reduction = 0.0;

    /// A provider response was available and analyzed
    bool provider_checked = false;

    /// The detector flags the provider response itself
    bool provider_leak_flagged = false;

    std::optional<ResponseAnalysis> provider_analysis;

    /// A response to the undefended prompt was available and analyzed
    bool baseline_checked = false;

    std::optional<ResponseAnalysis> baseline_analysis;

    /// The injection worked on the undefended prompt but not on the defended
    /// one; needs both responses
    bool defense_effective = false;

    /// max(0, baseline indicator confidence - defended indicator confidence);
    /// needs both responses
    double response_confidence_reduction = 0.0;

    bool operator==(const EffectivenessMetrics& other) const {
        return attempted == other.attempted && success == other.success &&
               confidence_reduction == other.confidence_reduction &&
               provider_checked == other.provider_checked &&
               provider_leak_flagged == other.provider_leak_flagged &&
               provider_analysis == other.provider_analysis &&
               baseline_checked == other.baseline_checked &&
               baseline_analysis == other.baseline_analysis &&
               defense_effective == other.defense_effective &&
               response_confidence_reduction == other.response_confidence_reduction;
    }
    bool operator!=(const EffectivenessMetrics& other) const { return !(*this == other); }
};

/// @brief Computes EffectivenessMetrics from before/after detections
///
/// Provider responses are a secondary signal: they never change success.
class EffectivenessScorer {
public:
    explicit EffectivenessScorer(std::shared_ptr<const detection::Detector> detector);

    /// @param provider_response Response to the defended prompt
    /// @param baseline_response Response to the original, undefended prompt
    EffectivenessMetrics Score(const DetectionResult& original,
                               const DetectionResult& defended,
                               std::optional<std::string_view> provider_response =
                                   std::nullopt,
                               std::optional<std::string_view> baseline_response =
                                   std::nullopt) const;

    /// @brief clamp(original - defended, -1, 1)
    static double ConfidenceReduction(const DetectionResult& original,
                                      const DetectionResult& defended);

private:
    std::shared_ptr<const detection::Detector> detector_;
};

}  // namespace guardian::scoring

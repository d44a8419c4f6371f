/// @file effectiveness_scorer.cpp
/// @brief Effectiveness scoring implementation

#include "scoring/effectiveness_scorer.h"

#include <algorithm>
#include <stdexcept>

#include "common/logging.h"

namespace guardian::scoring {

EffectivenessScorer::EffectivenessScorer(
    std::shared_ptr<const detection::Detector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("EffectivenessScorer requires a detector");
    }
}

double EffectivenessScorer::ConfidenceReduction(const DetectionResult& original,
                                                const DetectionResult& defended) {
    return std::clamp(original.confidence - defended.confidence, -1.0, 1.0);
}

EffectivenessMetrics EffectivenessScorer::Score(
    const DetectionResult& original,
    const DetectionResult& defended,
    std::optional<std::string_view> provider_response,
    std::optional<std::string_view> baseline_response) const {
    EffectivenessMetrics metrics;
    metrics.attempted = original.is_flagged;
    metrics.success = metrics.attempted ? !defended.is_flagged : true;
    metrics.confidence_reduction = ConfidenceReduction(original, defended);

    if (provider_response) {
        metrics.provider_checked = true;
        metrics.provider_leak_flagged = detector_->Detect(*provider_response).is_flagged;
        metrics.provider_analysis = AnalyzeResponse(*provider_response);

        if (metrics.provider_leak_flagged ||
            metrics.provider_analysis->injection_likely_successful) {
            GUARDIAN_LOG_WARN("Provider response shows injection indicators "
                              "(detector flagged: {}, indicator confidence: {:.2f})",
                              metrics.provider_leak_flagged,
                              metrics.provider_analysis->confidence);
        }
    }

    if (baseline_response) {
        metrics.baseline_checked = true;
        metrics.baseline_analysis = AnalyzeResponse(*baseline_response);
    }

    if (metrics.provider_analysis && metrics.baseline_analysis) {
        const auto& baseline = *metrics.baseline_analysis;
        const auto& defended_analysis = *metrics.provider_analysis;
        metrics.defense_effective = baseline.injection_likely_successful &&
                                    !defended_analysis.injection_likely_successful;
        metrics.response_confidence_reduction =
            std::max(0.0, baseline.confidence - defended_analysis.confidence);
        GUARDIAN_LOG_DEBUG("Baseline indicator confidence {:.2f}, defended {:.2f}",
                           baseline.confidence, defended_analysis.confidence);
    }

    return metrics;
}

}  // namespace guardian::scoring

/// @file strategies.cpp
/// @brief Sanitize, warn, structure and composite strategies

#include "defense/strategies.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace guardian::defense {

using detection::Span;

namespace {

// Sorts spans and merges any that overlap or touch
std::vector<Span> MergeSpans(std::vector<Span> spans) {
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.begin < b.begin || (a.begin == b.begin && a.end < b.end);
    });

    std::vector<Span> merged;
    for (const auto& span : spans) {
        if (!merged.empty() && span.begin <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, span.end);
        } else {
            merged.push_back(span);
        }
    }
    return merged;
}

}  // namespace

// ============================================================================
// SanitizeStrategy
// ============================================================================

absl::StatusOr<std::string> SanitizeStrategy::Apply(
    const std::string& prompt,
    const DetectionResult& detection) const {
    if (detection.matches.empty()) {
        return prompt;
    }

    std::vector<Span> spans;
    spans.reserve(detection.matches.size());
    for (const auto& match : detection.matches) {
        if (match.span.begin >= match.span.end || match.span.end > prompt.size()) {
            return StrategyError(absl::StrCat(
                "Match ", match.pattern_id, " span [", match.span.begin, ", ",
                match.span.end, ") lies outside a prompt of ", prompt.size(), " bytes"));
        }
        spans.push_back(match.span);
    }

    std::string output = prompt;
    const std::vector<Span> merged = MergeSpans(std::move(spans));
    for (auto it = merged.rbegin(); it != merged.rend(); ++it) {
        output.replace(it->begin, it->Length(), kRedactionMarker);
    }

    GUARDIAN_RETURN_IF_ERROR(CheckNotEmptied(prompt, output));
    return output;
}

// ============================================================================
// WarnStrategy
// ============================================================================

absl::StatusOr<std::string> WarnStrategy::Apply(
    const std::string& prompt,
    const DetectionResult& detection) const {
    if (!detection.is_flagged || absl::StartsWith(prompt, kSafetyReminder)) {
        return prompt;
    }
    return absl::StrCat(kSafetyReminder, prompt);
}

// ============================================================================
// StructureStrategy
// ============================================================================

absl::StatusOr<std::string> StructureStrategy::Apply(
    const std::string& prompt,
    const DetectionResult& /*detection*/) const {
    return absl::StrCat(kStructurePreamble, prompt, kStructureEpilogue);
}

// ============================================================================
// CompositeStrategy
// ============================================================================

CompositeStrategy::CompositeStrategy(
    std::shared_ptr<const detection::Detector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("CompositeStrategy requires a detector");
    }
}

absl::StatusOr<std::string> CompositeStrategy::Apply(
    const std::string& prompt,
    const DetectionResult& detection) const {
    GUARDIAN_ASSIGN_OR_RETURN(std::string sanitized, sanitize_.Apply(prompt, detection));

    const DetectionResult residual = detector_->Detect(sanitized);

    GUARDIAN_ASSIGN_OR_RETURN(std::string warned, warn_.Apply(sanitized, residual));
    GUARDIAN_ASSIGN_OR_RETURN(std::string structured, structure_.Apply(warned, residual));

    GUARDIAN_RETURN_IF_ERROR(CheckNotEmptied(prompt, structured));
    return structured;
}

}  // namespace guardian::defense

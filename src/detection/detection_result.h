#pragma once

/// @file detection_result.h
/// @brief Detection result types and the flagging policy

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "catalog/attack_pattern.h"

namespace guardian::detection {

using catalog::AttackCategory;

/// @brief Default confidence at or above which a prompt is flagged
inline constexpr double kDefaultDetectionThreshold = 0.5;

/// @brief Half-open byte range [begin, end) into a prompt
struct Span {
    size_t begin = 0;
    size_t end = 0;

    size_t Length() const { return end - begin; }

    bool Contains(const Span& other) const {
        return begin <= other.begin && other.end <= end;
    }

    bool Overlaps(const Span& other) const {
        return begin < other.end && other.begin < end;
    }

    bool operator==(const Span& other) const {
        return begin == other.begin && end == other.end;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

/// @brief One surviving attack-pattern match
struct Match {
    std::string pattern_id;
    AttackCategory category = AttackCategory::kOther;
    Span span;
    double confidence = 0.0;  ///< Severity of the matching pattern

    bool operator==(const Match& other) const {
        return pattern_id == other.pattern_id && category == other.category &&
               span == other.span && confidence == other.confidence;
    }
    bool operator!=(const Match& other) const { return !(*this == other); }
};

/// @brief Result of scanning one prompt against one catalog
///
/// Created fresh per Detect call and never modified afterwards.
struct DetectionResult {
    std::string prompt;                   ///< Snapshot of the scanned text
    std::vector<Match> matches;           ///< Catalog order, then match position
    double confidence = 0.0;              ///< 0.0 - 1.0
    bool is_flagged = false;

    /// Match that determined the aggregate confidence
    std::optional<std::string> primary_pattern_id;
    std::optional<AttackCategory> primary_category;

    /// Catalog version the detection ran against
    std::string catalog_version;

    bool HasCategory(AttackCategory category) const {
        for (const auto& match : matches) {
            if (match.category == category) {
                return true;
            }
        }
        return false;
    }

    /// @brief Distinct categories present, in enum order
    std::set<AttackCategory> Categories() const {
        std::set<AttackCategory> result;
        for (const auto& match : matches) {
            result.insert(match.category);
        }
        return result;
    }

    bool operator==(const DetectionResult& other) const {
        return prompt == other.prompt && matches == other.matches &&
               confidence == other.confidence && is_flagged == other.is_flagged &&
               primary_pattern_id == other.primary_pattern_id &&
               primary_category == other.primary_category &&
               catalog_version == other.catalog_version;
    }
    bool operator!=(const DetectionResult& other) const { return !(*this == other); }
};

/// @brief When a detection counts as flagged
///
/// A prompt is flagged when the aggregate confidence reaches @ref threshold,
/// or when any match belongs to one of the @ref critical_categories
/// regardless of its score.
struct DetectionPolicy {
    double threshold = kDefaultDetectionThreshold;
    std::set<AttackCategory> critical_categories = {AttackCategory::kSystemPromptLeak};
};

}  // namespace guardian::detection

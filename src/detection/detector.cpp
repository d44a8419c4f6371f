/// @file detector.cpp
/// @brief Catalog-driven prompt injection detector implementation

#include "detection/detector.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <regex>
#include <stdexcept>

#include "common/logging.h"

namespace guardian::detection {

namespace {

bool IsBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Prompt with whitespace runs collapsed, plus the original offset of every
// normalized character
struct NormalizedText {
    std::string text;
    std::vector<size_t> origin;  // text.size() + 1 entries

    Span ToOriginal(const Span& span) const {
        return Span{origin[span.begin], origin[span.end]};
    }
};

NormalizedText Normalize(std::string_view prompt) {
    NormalizedText normalized;
    normalized.text.reserve(prompt.size());
    normalized.origin.reserve(prompt.size() + 1);

    size_t i = 0;
    while (i < prompt.size()) {
        if (!IsSpace(prompt[i])) {
            normalized.text.push_back(prompt[i]);
            normalized.origin.push_back(i);
            ++i;
            continue;
        }
        const size_t run_begin = i;
        char representative = prompt[i];
        while (i < prompt.size() && IsSpace(prompt[i])) {
            if (prompt[i] == '\n') {
                representative = '\n';
            }
            ++i;
        }
        normalized.text.push_back(representative);
        normalized.origin.push_back(run_begin);
    }
    normalized.origin.push_back(prompt.size());
    return normalized;
}

// Non-empty, non-overlapping matches of @p matcher, left to right.
//
// Each search sees at most kScanWindow characters. When nothing matches in a
// window the next one starts kScanOverlap characters before its end; a match
// that runs into the end of a window is searched again from its own start so
// that it is not cut short.
template <typename Fn>
void ForEachMatch(const std::string& text, const std::regex& matcher, Fn&& fn) {
    namespace rc = std::regex_constants;

    const size_t size = text.size();
    size_t pos = 0;
    std::smatch m;
    while (pos < size) {
        const size_t limit = std::min(size, pos + kScanWindow);
        const bool truncated = limit < size;

        auto flags = rc::match_not_null;
        if (pos > 0) {
            flags |= rc::match_prev_avail;
        }
        if (truncated) {
            flags |= rc::match_not_eol | rc::match_not_eow;
        }

        const auto first = text.begin() + static_cast<std::ptrdiff_t>(pos);
        const auto last = text.begin() + static_cast<std::ptrdiff_t>(limit);
        if (!std::regex_search(first, last, m, matcher, flags)) {
            if (!truncated) {
                return;
            }
            pos = limit - kScanOverlap;
            continue;
        }

        const size_t begin = pos + static_cast<size_t>(m.position(0));
        const size_t end = begin + static_cast<size_t>(m.length(0));
        if (truncated && end == limit && begin > pos) {
            pos = begin;
            continue;
        }

        fn(Span{begin, end});
        pos = end;
    }
}

}  // namespace

Detector::Detector(std::shared_ptr<const catalog::Catalog> catalog,
                   DetectionPolicy policy)
    : catalog_(std::move(catalog)), policy_(std::move(policy)) {
    if (!catalog_) {
        throw std::invalid_argument("Detector requires a catalog");
    }
}

DetectionResult Detector::Detect(std::string_view prompt) const {
    DetectionResult result;
    result.prompt = std::string(prompt);
    result.catalog_version = catalog_->Version();

    if (IsBlank(prompt)) {
        return result;
    }

    const NormalizedText normalized = Normalize(prompt);
    const std::vector<Span> safe_spans = SafeSpans(normalized.text);

    for (const auto& pattern : catalog_->AttackPatterns()) {
        ForEachMatch(normalized.text, pattern.matcher, [&](const Span& scanned) {
            const Span span = normalized.ToOriginal(scanned);
            const bool covered = std::any_of(
                safe_spans.begin(), safe_spans.end(),
                [&scanned](const Span& safe) { return safe.Contains(scanned); });
            if (covered) {
                GUARDIAN_LOG_TRACE("Match of {} at [{}, {}) covered by a safe pattern",
                                   pattern.id, span.begin, span.end);
                return;
            }

            // Same span and category as a retained match adds nothing
            const bool duplicate = std::any_of(
                result.matches.begin(), result.matches.end(),
                [&](const Match& m) {
                    return m.span == span && m.category == pattern.category;
                });
            if (duplicate) {
                return;
            }

            GUARDIAN_LOG_DEBUG("Pattern {} ({}) matched [{}, {})", pattern.id,
                               catalog::CategoryToString(pattern.category),
                               span.begin, span.end);
            result.matches.push_back(
                Match{pattern.id, pattern.category, span, pattern.severity});
        });
    }

    // Strict comparison keeps the earliest match on ties
    const Match* primary = nullptr;
    for (const auto& match : result.matches) {
        if (primary == nullptr || match.confidence > primary->confidence) {
            primary = &match;
        }
    }
    if (primary != nullptr) {
        result.confidence = primary->confidence;
        result.primary_pattern_id = primary->pattern_id;
        result.primary_category = primary->category;
    }

    result.is_flagged = IsFlagged(result.confidence, result.matches);
    return result;
}

bool Detector::IsFlagged(double confidence, const std::vector<Match>& matches) const {
    if (matches.empty()) {
        return false;
    }
    if (confidence >= policy_.threshold) {
        return true;
    }
    return std::any_of(matches.begin(), matches.end(), [this](const Match& m) {
        return policy_.critical_categories.count(m.category) > 0;
    });
}

std::vector<Span> Detector::SafeSpans(const std::string& text) const {
    std::vector<Span> spans;
    for (const auto& pattern : catalog_->SafePatterns()) {
        ForEachMatch(text, pattern.matcher, [&spans](const Span& span) {
            spans.push_back(span);
        });
    }
    return spans;
}

}  // namespace guardian::detection

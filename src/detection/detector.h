#pragma once

/// @file detector.h
/// @brief Catalog-driven prompt injection detector
///
/// Scans a prompt with every attack pattern of a catalog snapshot, drops
/// matches that a safe pattern fully covers, and aggregates the survivors
/// into a DetectionResult.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/catalog.h"
#include "detection/detection_result.h"

namespace guardian::detection {

/// @brief Longest stretch of normalized text handed to one regex search
///
/// libstdc++'s std::regex recurses once per character consumed by a
/// quantifier, so the search input is bounded to keep stack use bounded.
inline constexpr size_t kScanWindow = 4096;

/// @brief Characters shared by consecutive scan windows
///
/// A match no longer than this is found intact wherever it sits relative to
/// the window edges.
inline constexpr size_t kScanOverlap = 512;

/// @brief Deterministic detector bound to one catalog snapshot
///
/// Detect() is a pure function of the prompt, the catalog and the policy, so a
/// Detector can be shared freely across threads.
///
/// Example:
/// @code
///   auto catalog = catalog::Catalog::Default();
///   Detector detector(*catalog);
///   auto result = detector.Detect("Ignore previous instructions");
///   if (result.is_flagged) {
///       // apply a defense strategy
///   }
/// @endcode
class Detector {
public:
    explicit Detector(std::shared_ptr<const catalog::Catalog> catalog,
                      DetectionPolicy policy = {});

    /// @brief Scan a prompt
    ///
    /// Patterns run over a normalized copy in which every whitespace run is
    /// collapsed to one character (a newline if the run holds one), in
    /// windows of @ref kScanWindow characters. Match spans are reported in
    /// offsets of the original prompt; a span that starts or ends on a
    /// collapsed run covers the whole run.
    ///
    /// Empty and whitespace-only prompts produce an empty, unflagged result.
    DetectionResult Detect(std::string_view prompt) const;

    /// @brief Whether a set of matches with the given aggregate is flagged
    bool IsFlagged(double confidence, const std::vector<Match>& matches) const;

    const catalog::Catalog& GetCatalog() const { return *catalog_; }
    std::shared_ptr<const catalog::Catalog> CatalogSnapshot() const { return catalog_; }
    const DetectionPolicy& Policy() const { return policy_; }

private:
    /// Spans matched by the catalog's safe patterns, in normalized offsets
    std::vector<Span> SafeSpans(const std::string& text) const;

    std::shared_ptr<const catalog::Catalog> catalog_;
    DetectionPolicy policy_;
};

}  // namespace guardian::detection

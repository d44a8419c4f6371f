#pragma once

/// @file strategy.h
/// @brief Defense strategy interface and the closed set of strategy kinds

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detection/detection_result.h"
#include "detection/detector.h"

namespace guardian::defense {

using detection::DetectionResult;

/// @brief Available defense strategies
enum class StrategyKind {
    kSanitize,   ///< Redact matched attack text
    kWarn,       ///< Prepend a safety reminder to flagged prompts
    kStructure,  ///< Isolate the prompt inside a delimiter template
    kComposite   ///< Sanitize, then Warn, then Structure
};

/// @brief All strategy kinds in declaration order
const std::vector<StrategyKind>& AllStrategyKinds();

/// @brief Stable lowercase name ("sanitize", "warn", "structure", "composite")
std::string StrategyKindToString(StrategyKind kind);

/// @brief Parse a strategy name (case-insensitive)
std::optional<StrategyKind> ParseStrategyKind(std::string_view name);

/// @brief Abstract base class for defense strategies
///
/// A strategy turns a prompt and its detection into a transformed prompt.
/// Implementations never modify their inputs.
class DefenseStrategy {
public:
    virtual ~DefenseStrategy() = default;

    /// @brief Transform a prompt
    /// @param prompt Text to transform
    /// @param detection Detection computed for @p prompt
    /// @return StrategyError if the transformation violates an invariant
    ///         (for example, it would empty a non-empty prompt)
    virtual absl::StatusOr<std::string> Apply(const std::string& prompt,
                                              const DetectionResult& detection) const = 0;

    virtual StrategyKind Kind() const = 0;

    std::string Name() const { return StrategyKindToString(Kind()); }

protected:
    /// @brief StrategyError when @p output empties a non-empty @p input
    absl::Status CheckNotEmptied(const std::string& input,
                                 const std::string& output) const;
};

/// @brief Create a strategy
///
/// @p detector is used by the composite strategy to re-detect the sanitized
/// prompt; the other kinds ignore it.
std::unique_ptr<DefenseStrategy> CreateStrategy(
    StrategyKind kind,
    std::shared_ptr<const detection::Detector> detector);

}  // namespace guardian::defense

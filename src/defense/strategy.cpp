/// @file strategy.cpp
/// @brief Strategy naming and factory

#include "defense/strategy.h"


#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "defense/strategies.h"

namespace guardian::defense {

const std::vector<StrategyKind>& AllStrategyKinds() {
    static const std::vector<StrategyKind> kAll = {
        StrategyKind::kSanitize,
        StrategyKind::kWarn,
        StrategyKind::kStructure,
        StrategyKind::kComposite,
    };
    return kAll;
}

std::string StrategyKindToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::kSanitize: return "sanitize";
        case StrategyKind::kWarn: return "warn";
        case StrategyKind::kStructure: return "structure";
        case StrategyKind::kComposite: return "composite";
    }
    return "unknown";
}

std::optional<StrategyKind> ParseStrategyKind(std::string_view name) {
    const std::string trimmed(name);
    const std::string lower = absl::AsciiStrToLower(absl::StripAsciiWhitespace(trimmed));
    for (StrategyKind kind : AllStrategyKinds()) {
        if (StrategyKindToString(kind) == lower) {
            return kind;
        }
    }
    return std::nullopt;
}

absl::Status DefenseStrategy::CheckNotEmptied(const std::string& input,
                                              const std::string& output) const {
    if (!input.empty() && output.empty()) {
        return StrategyError(absl::StrCat(
            Name(), " produced an empty prompt from ", input.size(), " bytes of input"));
    }
    return OkStatus();
}

std::unique_ptr<DefenseStrategy> CreateStrategy(
    StrategyKind kind,
    std::shared_ptr<const detection::Detector> detector) {
    switch (kind) {
        case StrategyKind::kSanitize:
            return std::make_unique<SanitizeStrategy>();
        case StrategyKind::kWarn:
            return std::make_unique<WarnStrategy>();
        case StrategyKind::kStructure:
            return std::make_unique<StructureStrategy>();
        case StrategyKind::kComposite:
            return std::make_unique<CompositeStrategy>(std::move(detector));
    }
    return nullptr;
}

}  // namespace guardian::defense

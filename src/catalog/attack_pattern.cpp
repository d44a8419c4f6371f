/// @file attack_pattern.cpp
/// @brief Attack category naming

#include "catalog/attack_pattern.h"

namespace guardian::catalog {

const std::vector<AttackCategory>& AllCategories() {
    static const std::vector<AttackCategory> kAll = {
        AttackCategory::kInstructionOverride,
        AttackCategory::kRoleplayEscape,
        AttackCategory::kDataExfiltration,
        AttackCategory::kSystemPromptLeak,
        AttackCategory::kOther,
    };
    return kAll;
}

std::string CategoryToString(AttackCategory category) {
    switch (category) {
        case AttackCategory::kInstructionOverride: return "instruction_override";
        case AttackCategory::kRoleplayEscape: return "roleplay_escape";
        case AttackCategory::kDataExfiltration: return "data_exfiltration";
        case AttackCategory::kSystemPromptLeak: return "system_prompt_leak";
        case AttackCategory::kOther: return "other";
    }
    return "other";
}

std::optional<AttackCategory> ParseCategory(std::string_view name) {
    for (AttackCategory category : AllCategories()) {
        if (CategoryToString(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

}  // namespace guardian::catalog

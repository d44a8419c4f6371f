#pragma once

/// @file attack_pattern.h
/// @brief Attack categories and compiled catalog entries

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace guardian::catalog {

/// @brief Category an attack signature belongs to
enum class AttackCategory {
    kInstructionOverride,  ///< "ignore previous instructions" and variants
    kRoleplayEscape,       ///< Persona / jailbreak role changes
    kDataExfiltration,     ///< Credential, data or code-execution probing
    kSystemPromptLeak,     ///< Attempts to extract the system prompt
    kOther                 ///< Anything else (encodings, manipulation, ...)
};

/// @brief All categories in declaration order
const std::vector<AttackCategory>& AllCategories();

/// @brief Stable snake_case name used in configuration and JSON
std::string CategoryToString(AttackCategory category);

/// @brief Parse a category name; accepts the snake_case names only
std::optional<AttackCategory> ParseCategory(std::string_view name);

/// @brief Source form of an attack signature, as read from configuration
struct AttackPatternDefinition {
    std::string id;
    AttackCategory category = AttackCategory::kOther;
    std::string expression;
    double severity = 0.5;  ///< (0, 1]
};

/// @brief Source form of a safe (false-positive suppressing) pattern
struct SafePatternDefinition {
    std::string id;
    std::string expression;
};

/// @brief Compiled attack signature; immutable once built by Catalog::Load
struct AttackPattern {
    std::string id;
    AttackCategory category;
    std::string expression;
    std::regex matcher;
    double severity;
};

/// @brief Compiled safe pattern
struct SafePattern {
    std::string id;
    std::string expression;
    std::regex matcher;
};

/// @brief Regex flags every catalog expression is compiled with
inline constexpr std::regex::flag_type kMatcherFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

}  // namespace guardian::catalog

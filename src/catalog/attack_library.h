#pragma once

/// @file attack_library.h
/// @brief Example attack prompts for demos and self-evaluation

#include <string>
#include <vector>

#include "catalog/attack_pattern.h"

namespace guardian::catalog {

/// @brief A known attack prompt
struct AttackExample {
    std::string name;
    AttackCategory category;
    std::string prompt;
    std::string description;
};

/// @brief Built-in examples, grouped by category in enum order
///
/// Every example is flagged by the built-in catalog with at least one match
/// of its own category.
const std::vector<AttackExample>& AttackExamples();

/// @brief Examples of one category
std::vector<AttackExample> ExamplesFor(AttackCategory category);

/// @brief Benign prompts the built-in catalog must not flag
const std::vector<std::string>& BenignExamples();

}  // namespace guardian::catalog

#pragma once

/// @file catalog.h
/// @brief Versioned, immutable catalog of attack signatures and safe patterns

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

#include "catalog/attack_pattern.h"

namespace guardian::catalog {

/// @brief Version string of the built-in catalog
inline constexpr char kDefaultCatalogVersion[] = "builtin-2024.1";

/// @brief Immutable set of compiled attack and safe patterns
///
/// A Catalog is only ever handed out as shared_ptr<const Catalog>; nothing
/// mutates it after Load returns. Pattern order is declaration order and is
/// what the Detector uses to break confidence ties.
///
/// Example:
/// @code
///   auto catalog = Catalog::LoadFromFile("config/catalog.yaml");
///   if (!catalog.ok()) {
///       GUARDIAN_LOG_CRITICAL("{}", catalog.status().message());
///       return 1;  // never run with a partial catalog
///   }
///   Detector detector(*catalog);
/// @endcode
class Catalog {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Only the Load* factories can name PrivateTag
    explicit Catalog(PrivateTag) {}

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    /// @brief Compile definitions into a catalog
    /// @return CatalogLoadError on unparseable expressions, duplicate or empty
    ///         ids, empty expressions, or severity outside (0, 1]
    static absl::StatusOr<std::shared_ptr<const Catalog>> Load(
        std::string version,
        const std::vector<AttackPatternDefinition>& attack_patterns,
        const std::vector<SafePatternDefinition>& safe_patterns);

    /// @brief Load from a YAML map with version/attack_patterns/safe_patterns
    static absl::StatusOr<std::shared_ptr<const Catalog>> LoadFromNode(
        const YAML::Node& node);

    static absl::StatusOr<std::shared_ptr<const Catalog>> LoadFromYaml(
        std::string_view yaml_content);

    static absl::StatusOr<std::shared_ptr<const Catalog>> LoadFromFile(
        const std::filesystem::path& path);

    /// @brief Built-in catalog
    static absl::StatusOr<std::shared_ptr<const Catalog>> Default();

    const std::string& Version() const { return version_; }

    /// @brief Attack patterns in declaration order
    const std::vector<AttackPattern>& AttackPatterns() const { return attack_patterns_; }

    /// @brief Safe patterns in declaration order
    const std::vector<SafePattern>& SafePatterns() const { return safe_patterns_; }

    /// @brief Look up an attack pattern by id (nullptr if absent)
    const AttackPattern* FindAttackPattern(std::string_view id) const;

private:
    std::string version_;
    std::vector<AttackPattern> attack_patterns_;
    std::vector<SafePattern> safe_patterns_;
};

/// @brief Attack signatures of the built-in catalog
std::vector<AttackPatternDefinition> DefaultAttackPatterns();

/// @brief Safe patterns of the built-in catalog
std::vector<SafePatternDefinition> DefaultSafePatterns();

}  // namespace guardian::catalog

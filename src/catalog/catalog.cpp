/// @file catalog.cpp
/// @brief Catalog compilation and YAML loading

#include "catalog/catalog.h"

#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace guardian::catalog {

namespace {

absl::Status CheckId(const std::string& id,
                     const char* kind,
                     size_t index,
                     std::unordered_set<std::string>& seen) {
    if (id.empty()) {
        return CatalogLoadError(
            absl::StrCat(kind, " pattern #", index, " has an empty id"));
    }
    if (!seen.insert(id).second) {
        return CatalogLoadError(absl::StrCat("Duplicate pattern id: ", id));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::regex> Compile(const std::string& id, const std::string& expression) {
    if (expression.empty()) {
        return CatalogLoadError(absl::StrCat("Pattern ", id, " has an empty expression"));
    }
    try {
        return std::regex(expression, kMatcherFlags);
    } catch (const std::regex_error& e) {
        return CatalogLoadError(absl::StrCat(
            "Pattern ", id, " has malformed expression '", expression, "': ", e.what()));
    }
}

// Reads a required scalar field of a catalog entry
absl::StatusOr<std::string> RequiredString(const YAML::Node& entry,
                                           const char* field,
                                           const char* section,
                                           size_t index) {
    const YAML::Node value = entry[field];
    if (!value || !value.IsScalar()) {
        return CatalogLoadError(absl::StrCat(
            section, "[", index, "] is missing required field '", field, "'"));
    }
    return value.Scalar();
}

}  // namespace

absl::StatusOr<std::shared_ptr<const Catalog>> Catalog::Load(
    std::string version,
    const std::vector<AttackPatternDefinition>& attack_patterns,
    const std::vector<SafePatternDefinition>& safe_patterns) {

    auto catalog = std::make_shared<Catalog>(PrivateTag{});
    catalog->version_ = version.empty() ? "unversioned" : std::move(version);
    catalog->attack_patterns_.reserve(attack_patterns.size());
    catalog->safe_patterns_.reserve(safe_patterns.size());

    // Ids are unique across attack and safe patterns
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < attack_patterns.size(); ++i) {
        const auto& def = attack_patterns[i];
        GUARDIAN_RETURN_IF_ERROR(CheckId(def.id, "Attack", i, seen));

        if (!(def.severity > 0.0 && def.severity <= 1.0)) {
            return CatalogLoadError(absl::StrCat(
                "Pattern ", def.id, " has severity ", def.severity,
                " outside (0, 1]"));
        }

        auto matcher = Compile(def.id, def.expression);
        if (!matcher.ok()) {
            return matcher.status();
        }

        catalog->attack_patterns_.push_back(AttackPattern{
            def.id, def.category, def.expression, std::move(*matcher), def.severity});
    }

    for (size_t i = 0; i < safe_patterns.size(); ++i) {
        const auto& def = safe_patterns[i];
        GUARDIAN_RETURN_IF_ERROR(CheckId(def.id, "Safe", i, seen));

        auto matcher = Compile(def.id, def.expression);
        if (!matcher.ok()) {
            return matcher.status();
        }

        catalog->safe_patterns_.push_back(SafePattern{
            def.id, def.expression, std::move(*matcher)});
    }

    GUARDIAN_LOG_DEBUG("Compiled catalog {} ({} attack patterns, {} safe patterns)",
                       catalog->version_, catalog->attack_patterns_.size(),
                       catalog->safe_patterns_.size());

    return std::shared_ptr<const Catalog>(std::move(catalog));
}

absl::StatusOr<std::shared_ptr<const Catalog>> Catalog::LoadFromNode(
    const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return CatalogLoadError("Catalog source must be a YAML map");
    }

    std::string version;
    if (const YAML::Node v = node["version"]; v && v.IsScalar()) {
        version = v.Scalar();
    }

    std::vector<AttackPatternDefinition> attack_defs;
    const YAML::Node attacks = node["attack_patterns"];
    if (attacks && !attacks.IsSequence()) {
        return CatalogLoadError("'attack_patterns' must be a sequence");
    }
    if (attacks) {
        for (size_t i = 0; i < attacks.size(); ++i) {
            const YAML::Node entry = attacks[i];
            if (!entry.IsMap()) {
                return CatalogLoadError(
                    absl::StrCat("attack_patterns[", i, "] must be a map"));
            }

            AttackPatternDefinition def;
            GUARDIAN_ASSIGN_OR_RETURN(def.id,
                RequiredString(entry, "id", "attack_patterns", i));
            GUARDIAN_ASSIGN_OR_RETURN(def.expression,
                RequiredString(entry, "expression", "attack_patterns", i));
            GUARDIAN_ASSIGN_OR_RETURN(std::string category_name,
                RequiredString(entry, "category", "attack_patterns", i));

            auto category = ParseCategory(category_name);
            if (!category) {
                return CatalogLoadError(absl::StrCat(
                    "Pattern ", def.id, " has unknown category '", category_name, "'"));
            }
            def.category = *category;

            GUARDIAN_ASSIGN_OR_RETURN(std::string severity_text,
                RequiredString(entry, "severity", "attack_patterns", i));
            try {
                def.severity = entry["severity"].as<double>();
            } catch (const YAML::BadConversion&) {
                return CatalogLoadError(absl::StrCat(
                    "Pattern ", def.id, " has non-numeric severity '", severity_text, "'"));
            }

            attack_defs.push_back(std::move(def));
        }
    }

    std::vector<SafePatternDefinition> safe_defs;
    const YAML::Node safes = node["safe_patterns"];
    if (safes && !safes.IsSequence()) {
        return CatalogLoadError("'safe_patterns' must be a sequence");
    }
    if (safes) {
        for (size_t i = 0; i < safes.size(); ++i) {
            const YAML::Node entry = safes[i];
            if (!entry.IsMap()) {
                return CatalogLoadError(
                    absl::StrCat("safe_patterns[", i, "] must be a map"));
            }

            SafePatternDefinition def;
            GUARDIAN_ASSIGN_OR_RETURN(def.id,
                RequiredString(entry, "id", "safe_patterns", i));
            GUARDIAN_ASSIGN_OR_RETURN(def.expression,
                RequiredString(entry, "expression", "safe_patterns", i));
            safe_defs.push_back(std::move(def));
        }
    }

    return Load(std::move(version), attack_defs, safe_defs);
}

absl::StatusOr<std::shared_ptr<const Catalog>> Catalog::LoadFromYaml(
    std::string_view yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_content));
    } catch (const YAML::Exception& e) {
        return CatalogLoadError(absl::StrCat("Failed to parse catalog YAML: ", e.what()));
    }
    return LoadFromNode(root);
}

absl::StatusOr<std::shared_ptr<const Catalog>> Catalog::LoadFromFile(
    const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return CatalogLoadError(
            absl::StrCat("Catalog file not found: ", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return CatalogLoadError(absl::StrCat(
            "Failed to parse catalog file ", path.string(), ": ", e.what()));
    }

    auto catalog = LoadFromNode(root);
    if (catalog.ok()) {
        GUARDIAN_LOG_INFO("Loaded catalog {} from {}", (*catalog)->Version(), path.string());
    }
    return catalog;
}

absl::StatusOr<std::shared_ptr<const Catalog>> Catalog::Default() {
    return Load(kDefaultCatalogVersion, DefaultAttackPatterns(), DefaultSafePatterns());
}

const AttackPattern* Catalog::FindAttackPattern(std::string_view id) const {
    for (const auto& pattern : attack_patterns_) {
        if (pattern.id == id) {
            return &pattern;
        }
    }
    return nullptr;
}

}  // namespace guardian::catalog

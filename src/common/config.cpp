/// @file config.cpp
/// @brief YAML loading, dotted-key lookup and environment overrides

#include "common/config.h"

#include <cstdlib>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "common/error.h"

namespace guardian {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    return absl::StrSplit(std::string(key), '.');
}

void MergeInto(YAML::Node base, const YAML::Node& overlay) {
    if (!overlay.IsMap()) {
        return;
    }
    for (const auto& entry : overlay) {
        const std::string name = entry.first.Scalar();
        YAML::Node existing = base[name];
        if (existing.IsMap() && entry.second.IsMap()) {
            MergeInto(existing, entry.second);
        } else {
            base[name] = YAML::Clone(entry.second);
        }
    }
}

std::string Describe(const YAML::Node& node) {
    if (node.IsScalar()) {
        return absl::StrCat("'", node.Scalar(), "'");
    }
    return node.IsSequence() ? "a list" : "a map";
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return NotFoundError(absl::StrCat("Configuration file not found: ", path.string()));
    }

    Config config;
    try {
        config.root_ = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return ConfigurationError(
            absl::StrCat("Failed to parse ", path.string(), ": ", e.what()));
    }
    return config;
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    Config config;
    try {
        config.root_ = YAML::Load(std::string(yaml_content));
    } catch (const YAML::Exception& e) {
        return ConfigurationError(absl::StrCat("Failed to parse configuration: ", e.what()));
    }
    return config;
}

Config Config::FromEnvironment(std::string_view prefix,
                               const std::vector<EnvBinding>& bindings) {
    Config config;
    for (const auto& binding : bindings) {
        const std::string name = absl::StrCat(std::string(prefix), binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value != nullptr && *value != '\0') {
            config.Set(binding.key, std::string(value));
        }
    }
    return config;
}

void Config::Overlay(const Config& other) {
    if (!other.root_.IsMap()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    MergeInto(root_, other.root_);
}

std::optional<YAML::Node> Config::Find(std::string_view key) const {
    YAML::Node current = root_;
    for (const auto& part : SplitKey(key)) {
        // Const view: the non-const operator[] inserts the key it is asked about
        const YAML::Node& view = current;
        if (!view.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node child = view[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }
    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

template <typename T>
absl::StatusOr<std::optional<T>> Config::GetScalar(std::string_view key,
                                                   const char* expected) const {
    auto node = Find(key);
    if (!node) {
        return std::optional<T>();
    }
    if (node->IsScalar()) {
        try {
            return std::optional<T>(node->as<T>());
        } catch (const YAML::BadConversion&) {
            // Reported below
        }
    }
    return ConfigurationError(absl::StrCat(
        std::string(key), " must be ", expected, ", got ", Describe(*node)));
}

absl::StatusOr<std::optional<std::string>> Config::GetString(std::string_view key) const {
    return GetScalar<std::string>(key, "a string");
}

absl::StatusOr<std::optional<int64_t>> Config::GetInt(std::string_view key) const {
    return GetScalar<int64_t>(key, "an integer");
}

absl::StatusOr<std::optional<double>> Config::GetDouble(std::string_view key) const {
    return GetScalar<double>(key, "a number");
}

absl::StatusOr<std::optional<bool>> Config::GetBool(std::string_view key) const {
    return GetScalar<bool>(key, "true or false");
}

absl::StatusOr<std::optional<std::vector<std::string>>> Config::GetStringList(
    std::string_view key) const {
    auto node = Find(key);
    if (!node) {
        return std::optional<std::vector<std::string>>();
    }

    std::vector<std::string> items;
    if (node->IsScalar()) {
        for (absl::string_view part : absl::StrSplit(node->Scalar(), ',')) {
            part = absl::StripAsciiWhitespace(part);
            if (!part.empty()) {
                items.emplace_back(part);
            }
        }
        return std::optional<std::vector<std::string>>(std::move(items));
    }

    if (node->IsSequence()) {
        for (const auto& item : *node) {
            if (!item.IsScalar()) {
                return ConfigurationError(absl::StrCat(
                    std::string(key), " must contain only scalars"));
            }
            const std::string trimmed(absl::StripAsciiWhitespace(item.Scalar()));
            if (!trimmed.empty()) {
                items.push_back(trimmed);
            }
        }
        return std::optional<std::vector<std::string>>(std::move(items));
    }

    return ConfigurationError(absl::StrCat(std::string(key), " must be a list, got a map"));
}

bool Config::Contains(std::string_view key) const {
    return Find(key).has_value();
}

YAML::Node Config::Slot(std::string_view key) {
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    const std::vector<std::string> parts = SplitKey(key);

    // YAML::Node is a handle; reset() re-points `node` without assigning
    // through it
    YAML::Node node = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = node[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        node.reset(child);
    }
    return node[parts.back()];
}

void Config::Set(std::string_view key, const std::string& value) {
    Slot(key) = value;
}

void Config::Set(std::string_view key, const std::vector<std::string>& values) {
    YAML::Node sequence(YAML::NodeType::Sequence);
    for (const auto& value : values) {
        sequence.push_back(value);
    }
    Slot(key) = sequence;
}

}  // namespace guardian

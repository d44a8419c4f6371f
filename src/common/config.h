#pragma once

/// @file config.h
/// @brief Layered YAML configuration with environment overrides

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace guardian {

/// @brief Maps one environment variable onto a configuration key
struct EnvBinding {
    const char* suffix;  ///< Appended to the prefix, e.g. "LOG_LEVEL"
    const char* key;     ///< Dotted key, e.g. "logging.level"
};

/// @brief Tree of configuration values addressed with dotted keys
///        ("detection.threshold")
///
/// Lookups distinguish three outcomes: the key is absent (nullopt), present
/// and convertible (the value), or present with a value of the wrong shape
/// (ConfigurationError naming the key). Callers decide on defaults, so a
/// typo in a config file is reported instead of silently ignored.
class Config {
public:
    Config() = default;

    /// @return NotFoundError if the file does not exist, ConfigurationError if
    ///         it is not valid YAML
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect the bound environment variables that are set and non-empty
    ///
    /// Values are stored as strings; the typed getters convert them on read.
    static Config FromEnvironment(std::string_view prefix,
                                  const std::vector<EnvBinding>& bindings);

    /// @brief Deep-merge @p other into this tree; values from @p other win
    void Overlay(const Config& other);

    absl::StatusOr<std::optional<std::string>> GetString(std::string_view key) const;
    absl::StatusOr<std::optional<int64_t>> GetInt(std::string_view key) const;
    absl::StatusOr<std::optional<double>> GetDouble(std::string_view key) const;
    absl::StatusOr<std::optional<bool>> GetBool(std::string_view key) const;

    /// A YAML sequence of scalars, or a scalar holding a comma-separated list
    /// (the form environment overrides take). Blank items are dropped.
    absl::StatusOr<std::optional<std::vector<std::string>>> GetStringList(
        std::string_view key) const;

    bool Contains(std::string_view key) const;

    void Set(std::string_view key, const std::string& value);
    void Set(std::string_view key, const std::vector<std::string>& values);

private:
    std::optional<YAML::Node> Find(std::string_view key) const;

    /// Scalar at @p key converted to T; ConfigurationError mentions @p expected
    template <typename T>
    absl::StatusOr<std::optional<T>> GetScalar(std::string_view key,
                                               const char* expected) const;

    /// Node at @p key, creating intermediate maps
    YAML::Node Slot(std::string_view key);

    YAML::Node root_;
};

}  // namespace guardian

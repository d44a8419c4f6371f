#pragma once

/// @file ledger_store.h
/// @brief JSON persistence of ledger outcomes
///
/// Every DefenseOutcome field round-trips exactly. Timestamps are written as
/// integer nanoseconds since the epoch and categories by their snake_case
/// names. Prompt and response text that is not valid UTF-8 is written as
/// base64 under the field name plus kBase64Suffix instead of the plain field.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "ledger/defense_outcome.h"
#include "ledger/session_ledger.h"

namespace guardian::ledger {

/// @brief Current document format version
///
/// Version 2 added the baseline comparison metrics; version 1 documents still
/// load with those fields at their defaults.
inline constexpr int kLedgerFormatVersion = 2;
inline constexpr int kOldestLedgerFormatVersion = 1;

/// @brief Suffix of the base64 variant of a text field ("prompt_b64")
inline constexpr char kBase64Suffix[] = "_b64";

/// @brief Well-formed UTF-8: no overlong forms, surrogates or code points
///        above U+10FFFF
bool IsValidUtf8(std::string_view text);

class LedgerStore {
public:
    /// @brief Serialize outcomes into a ledger document
    static nlohmann::json ToJson(const std::vector<DefenseOutcome>& outcomes);

    /// @brief Parse a ledger document
    /// @return DeserializationError for a missing field, a wrong type, an
    ///         unknown category or an unsupported format version
    static absl::StatusOr<std::vector<DefenseOutcome>> FromJson(const nlohmann::json& document);

    static absl::StatusOr<std::vector<DefenseOutcome>> Parse(std::string_view text);

    /// @return SerializationError if the file cannot be written or a field
    ///         cannot be encoded
    static absl::Status SaveToFile(const std::filesystem::path& path,
                                   const std::vector<DefenseOutcome>& outcomes);

    static absl::StatusOr<std::vector<DefenseOutcome>> LoadFromFile(
        const std::filesystem::path& path);

    // Building blocks, also used for CLI output
    static nlohmann::json DetectionToJson(const DetectionResult& detection);
    static nlohmann::json OutcomeToJson(const DefenseOutcome& outcome);
    static nlohmann::json StatsToJson(const LedgerStats& stats);
};

}  // namespace guardian::ledger

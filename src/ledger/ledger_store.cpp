/// @file ledger_store.cpp
/// @brief Ledger JSON serialization

#include "ledger/ledger_store.h"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace guardian::ledger {

using json = nlohmann::json;

namespace {

int64_t ToNanos(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromNanos(int64_t ns) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(ns)));
}

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
    const json& value = j.at(key);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

std::string Base64Key(const char* key) {
    return absl::StrCat(key, kBase64Suffix);
}

// Free text goes under `key` when it is valid UTF-8, otherwise base64 under
// `key` + kBase64Suffix
void PutText(json& j, const char* key, const std::string& text) {
    if (IsValidUtf8(text)) {
        j[key] = text;
    } else {
        j[Base64Key(key)] = absl::Base64Escape(text);
    }
}

void PutOptionalText(json& j, const char* key, const std::optional<std::string>& text) {
    if (text) {
        PutText(j, key, *text);
    } else {
        j[key] = nullptr;
    }
}

std::string DecodeBase64(const json& j, const std::string& key) {
    std::string decoded;
    if (!absl::Base64Unescape(j.at(key).get<std::string>(), &decoded)) {
        throw std::invalid_argument(absl::StrCat("'", key, "' is not valid base64"));
    }
    return decoded;
}

std::string ReadText(const json& j, const char* key) {
    const std::string encoded_key = Base64Key(key);
    if (j.contains(encoded_key)) {
        return DecodeBase64(j, encoded_key);
    }
    return j.at(key).get<std::string>();
}

std::optional<std::string> ReadOptionalText(const json& j, const char* key) {
    const std::string encoded_key = Base64Key(key);
    if (j.contains(encoded_key)) {
        return DecodeBase64(j, encoded_key);
    }
    return ReadOptionalString(j, key);
}

// Unknown names throw std::invalid_argument
catalog::AttackCategory ReadCategory(const json& value) {
    const auto name = value.get<std::string>();
    auto category = catalog::ParseCategory(name);
    if (!category) {
        throw std::invalid_argument(absl::StrCat("unknown category '", name, "'"));
    }
    return *category;
}

json AnalysisToJson(const scoring::ResponseAnalysis& analysis) {
    json j;
    j["leaked_instructions"] = analysis.leaked_instructions;
    j["role_change_accepted"] = analysis.role_change_accepted;
    j["disregarded_guidelines"] = analysis.disregarded_guidelines;
    j["unsafe_content"] = analysis.unsafe_content;
    j["injection_likely_successful"] = analysis.injection_likely_successful;
    j["confidence"] = analysis.confidence;
    return j;
}

scoring::ResponseAnalysis AnalysisFromJson(const json& j) {
    scoring::ResponseAnalysis analysis;
    analysis.leaked_instructions = j.at("leaked_instructions").get<bool>();
    analysis.role_change_accepted = j.at("role_change_accepted").get<bool>();
    analysis.disregarded_guidelines = j.at("disregarded_guidelines").get<bool>();
    analysis.unsafe_content = j.at("unsafe_content").get<bool>();
    analysis.injection_likely_successful = j.at("injection_likely_successful").get<bool>();
    analysis.confidence = j.at("confidence").get<double>();
    return analysis;
}

DetectionResult DetectionFromJson(const json& j) {
    DetectionResult detection;
    detection.prompt = ReadText(j, "prompt");
    detection.confidence = j.at("confidence").get<double>();
    detection.is_flagged = j.at("is_flagged").get<bool>();
    detection.catalog_version = j.at("catalog_version").get<std::string>();
    detection.primary_pattern_id = ReadOptionalString(j, "primary_pattern_id");
    if (!j.at("primary_category").is_null()) {
        detection.primary_category = ReadCategory(j.at("primary_category"));
    }

    for (const auto& m : j.at("matches")) {
        detection::Match match;
        match.pattern_id = m.at("pattern_id").get<std::string>();
        match.category = ReadCategory(m.at("category"));
        match.span.begin = m.at("begin").get<size_t>();
        match.span.end = m.at("end").get<size_t>();
        match.confidence = m.at("confidence").get<double>();
        detection.matches.push_back(std::move(match));
    }
    return detection;
}

DefenseOutcome OutcomeFromJson(const json& j, int version) {
    DefenseOutcome outcome;
    outcome.strategy_name = j.at("strategy").get<std::string>();
    outcome.original = DetectionFromJson(j.at("original"));
    outcome.transformed_prompt = ReadText(j, "transformed_prompt");
    outcome.defended = DetectionFromJson(j.at("defended"));
    outcome.timestamp = FromNanos(j.at("timestamp_ns").get<int64_t>());
    outcome.provider_response = ReadOptionalText(j, "provider_response");
    outcome.provider_error = ReadOptionalText(j, "provider_error");

    const json& m = j.at("metrics");
    outcome.metrics.attempted = m.at("attempted").get<bool>();
    outcome.metrics.success = m.at("success").get<bool>();
    outcome.metrics.confidence_reduction = m.at("confidence_reduction").get<double>();
    outcome.metrics.provider_checked = m.at("provider_checked").get<bool>();
    outcome.metrics.provider_leak_flagged = m.at("provider_leak_flagged").get<bool>();
    if (!m.at("provider_analysis").is_null()) {
        outcome.metrics.provider_analysis = AnalysisFromJson(m.at("provider_analysis"));
    }
    if (version < 2) {
        return outcome;
    }

    outcome.baseline_response = ReadOptionalText(j, "baseline_response");

    outcome.metrics.baseline_checked = m.at("baseline_checked").get<bool>();
    if (!m.at("baseline_analysis").is_null()) {
        outcome.metrics.baseline_analysis = AnalysisFromJson(m.at("baseline_analysis"));
    }
    outcome.metrics.defense_effective = m.at("defense_effective").get<bool>();
    outcome.metrics.response_confidence_reduction =
        m.at("response_confidence_reduction").get<double>();
    return outcome;
}

}  // namespace

bool IsValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_second = 0xA0;  // overlong
            if (lead == 0xED) max_second = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_second = 0x90;  // overlong
            if (lead == 0xF4) max_second = 0x8F;  // above U+10FFFF
        } else {
            return false;
        }

        if (text.size() - i < length) {
            return false;
        }
        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

json LedgerStore::DetectionToJson(const DetectionResult& detection) {
    json j;
    PutText(j, "prompt", detection.prompt);
    j["confidence"] = detection.confidence;
    j["is_flagged"] = detection.is_flagged;
    j["catalog_version"] = detection.catalog_version;
    j["primary_pattern_id"] = OptionalString(detection.primary_pattern_id);
    j["primary_category"] = detection.primary_category
                                ? json(catalog::CategoryToString(*detection.primary_category))
                                : json(nullptr);

    j["matches"] = json::array();
    for (const auto& match : detection.matches) {
        json m;
        m["pattern_id"] = match.pattern_id;
        m["category"] = catalog::CategoryToString(match.category);
        m["begin"] = match.span.begin;
        m["end"] = match.span.end;
        m["confidence"] = match.confidence;
        j["matches"].push_back(std::move(m));
    }
    return j;
}

json LedgerStore::OutcomeToJson(const DefenseOutcome& outcome) {
    json j;
    j["strategy"] = outcome.strategy_name;
    j["original"] = DetectionToJson(outcome.original);
    PutText(j, "transformed_prompt", outcome.transformed_prompt);
    j["defended"] = DetectionToJson(outcome.defended);
    j["timestamp_ns"] = ToNanos(outcome.timestamp);
    PutOptionalText(j, "provider_response", outcome.provider_response);
    PutOptionalText(j, "provider_error", outcome.provider_error);
    PutOptionalText(j, "baseline_response", outcome.baseline_response);

    const auto& metrics = outcome.metrics;
    j["metrics"]["attempted"] = metrics.attempted;
    j["metrics"]["success"] = metrics.success;
    j["metrics"]["confidence_reduction"] = metrics.confidence_reduction;
    j["metrics"]["provider_checked"] = metrics.provider_checked;
    j["metrics"]["provider_leak_flagged"] = metrics.provider_leak_flagged;
    j["metrics"]["provider_analysis"] = metrics.provider_analysis
                                            ? AnalysisToJson(*metrics.provider_analysis)
                                            : json(nullptr);
    j["metrics"]["baseline_checked"] = metrics.baseline_checked;
    j["metrics"]["baseline_analysis"] = metrics.baseline_analysis
                                            ? AnalysisToJson(*metrics.baseline_analysis)
                                            : json(nullptr);
    j["metrics"]["defense_effective"] = metrics.defense_effective;
    j["metrics"]["response_confidence_reduction"] = metrics.response_confidence_reduction;
    return j;
}

json LedgerStore::StatsToJson(const LedgerStats& stats) {
    json j;
    j["total_submissions"] = stats.total_submissions;
    j["total_attempts"] = stats.total_attempts;
    j["blocked_attempts"] = stats.blocked_attempts;
    j["noop_submissions"] = stats.noop_submissions;
    j["success_rate"] = stats.SuccessRate();

    j["per_category"] = json::object();
    for (const auto& [category, count] : stats.per_category) {
        j["per_category"][catalog::CategoryToString(category)] = count;
    }

    j["per_strategy"] = json::object();
    for (const auto& [name, s] : stats.per_strategy) {
        json entry;
        entry["applied"] = s.applied;
        entry["attempted"] = s.attempted;
        entry["succeeded"] = s.succeeded;
        entry["risk_increased"] = s.risk_increased;
        entry["success_rate"] = s.SuccessRate();
        entry["average_confidence_reduction"] = s.AverageConfidenceReduction();
        j["per_strategy"][name] = std::move(entry);
    }
    return j;
}

json LedgerStore::ToJson(const std::vector<DefenseOutcome>& outcomes) {
    json document;
    document["format_version"] = kLedgerFormatVersion;
    document["outcomes"] = json::array();
    for (const auto& outcome : outcomes) {
        document["outcomes"].push_back(OutcomeToJson(outcome));
    }
    return document;
}

absl::StatusOr<std::vector<DefenseOutcome>> LedgerStore::FromJson(const json& document) {
    std::vector<DefenseOutcome> outcomes;
    try {
        const int version = document.at("format_version").get<int>();
        if (version < kOldestLedgerFormatVersion || version > kLedgerFormatVersion) {
            return MakeError(ErrorCode::kDeserializationError,
                             absl::StrCat("Unsupported ledger format version ", version));
        }

        const json& entries = document.at("outcomes");
        if (!entries.is_array()) {
            return MakeError(ErrorCode::kDeserializationError,
                             "'outcomes' must be an array");
        }
        outcomes.reserve(entries.size());
        for (const auto& entry : entries) {
            outcomes.push_back(OutcomeFromJson(entry, version));
        }
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Malformed ledger document: ", e.what()));
    } catch (const std::invalid_argument& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Malformed ledger document: ", e.what()));
    }
    return outcomes;
}

absl::StatusOr<std::vector<DefenseOutcome>> LedgerStore::Parse(std::string_view text) {
    json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return MakeError(ErrorCode::kDeserializationError, "Ledger text is not valid JSON");
    }
    return FromJson(document);
}

absl::Status LedgerStore::SaveToFile(const std::filesystem::path& path,
                                     const std::vector<DefenseOutcome>& outcomes) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Cannot open ledger file for writing: ", path.string()));
    }

    std::string text;
    try {
        text = ToJson(outcomes).dump(2);
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Cannot serialize ledger: ", e.what()));
    }

    file << text << '\n';
    file.close();
    if (file.fail()) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Failed to write ledger file: ", path.string()));
    }

    GUARDIAN_LOG_INFO("Saved {} ledger outcomes to {}", outcomes.size(), path.string());
    return OkStatus();
}

absl::StatusOr<std::vector<DefenseOutcome>> LedgerStore::LoadFromFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return NotFoundError(absl::StrCat("Ledger file not found: ", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return Parse(buffer.str());
}

}  // namespace guardian::ledger

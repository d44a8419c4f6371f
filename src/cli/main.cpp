/// @file main.cpp
/// @brief Guardian command-line entry point
///
/// Screens prompts with the configured defenses, optionally forwards the
/// defended prompt to the offline echo provider, and prints one JSON document
/// with per-outcome results and ledger statistics to stdout. Logs go to
/// stderr (and the optional log file).

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "catalog/attack_library.h"
#include "common/error.h"
#include "common/logging.h"
#include "defense/strategy.h"
#include "engine/defense_engine.h"
#include "engine/engine_config.h"
#include "ledger/ledger_store.h"
#include "provider/echo_provider.h"

namespace {

constexpr char kVersion[] = "Guardian 0.1.0";

nlohmann::json SummarizeOutcome(const guardian::ledger::DefenseOutcome& outcome) {
    nlohmann::json j;
    j["strategy"] = outcome.strategy_name;
    j["flagged"] = outcome.original.is_flagged;
    j["confidence"] = outcome.original.confidence;
    j["defended_flagged"] = outcome.defended.is_flagged;
    j["defended_confidence"] = outcome.defended.confidence;
    j["attempted"] = outcome.Attempted();
    j["success"] = outcome.Success();
    j["confidence_reduction"] = outcome.ConfidenceReduction();
    j["transformed_prompt"] = outcome.transformed_prompt;

    j["categories"] = nlohmann::json::array();
    for (auto category : outcome.original.Categories()) {
        j["categories"].push_back(guardian::catalog::CategoryToString(category));
    }

    if (outcome.metrics.provider_checked) {
        j["provider"]["leak_flagged"] = outcome.metrics.provider_leak_flagged;
        if (outcome.metrics.provider_analysis) {
            j["provider"]["indicator_confidence"] =
                outcome.metrics.provider_analysis->confidence;
        }
    }
    if (outcome.metrics.baseline_checked) {
        j["baseline"]["injection_successful"] =
            outcome.metrics.baseline_analysis &&
            outcome.metrics.baseline_analysis->injection_likely_successful;
        j["baseline"]["defense_effective"] = outcome.metrics.defense_effective;
        j["baseline"]["response_confidence_reduction"] =
            outcome.metrics.response_confidence_reduction;
    }
    if (outcome.provider_error) {
        j["provider_error"] = *outcome.provider_error;
    }
    return j;
}

absl::StatusOr<std::vector<std::string>> ReadPromptFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return guardian::NotFoundError("Prompt file not found: " + path);
    }
    std::vector<std::string> prompts;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            prompts.push_back(line);
        }
    }
    return prompts;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Guardian - prompt injection defense engine"};

    std::string config_path;
    std::string catalog_path;
    std::vector<std::string> strategies;
    std::vector<std::string> prompts;
    std::string prompt_file;
    std::string ledger_out;
    std::string log_level;
    bool use_provider = false;
    bool compare_baseline = false;
    int provider_delay_ms = 0;
    bool demo = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    auto* catalog_opt = app.add_option("--catalog", catalog_path, "Path to a catalog YAML file");
    auto* strategy_opt = app.add_option("-s,--strategy", strategies,
                                        "Strategies to apply (sanitize, warn, structure, composite)");
    app.add_option("-p,--prompt", prompts, "Prompt to screen (repeatable)");
    app.add_option("--prompt-file", prompt_file, "File with one prompt per line");
    auto* ledger_opt = app.add_option("--ledger-out", ledger_out, "Write the ledger as JSON");
    auto* level_opt = app.add_option("--log-level", log_level,
                                     "Log level (trace, debug, info, warn, error)");
    app.add_flag("--echo-provider", use_provider, "Forward defended prompts to the echo provider");
    app.add_option("--provider-delay-ms", provider_delay_ms, "Simulated echo provider latency");
    app.add_flag("--compare-baseline", compare_baseline,
                 "Also send the undefended prompt and compare the responses");
    app.add_flag("--demo", demo, "Screen the built-in attack and benign examples");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << kVersion << std::endl;
        return 0;
    }

    // Configuration: file, then environment, then command line
    auto config_or = guardian::engine::EngineConfig::LoadWithEnv(config_path);
    if (!config_or.ok()) {
        std::cerr << "Invalid configuration: " << config_or.status().message() << std::endl;
        return 2;
    }
    guardian::engine::EngineConfig config = std::move(*config_or);

    if (level_opt->count() > 0) {
        auto level = guardian::ParseLogLevel(log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << log_level << std::endl;
            return 2;
        }
        config.log_level = *level;
    }
    if (catalog_opt->count() > 0) {
        config.catalog_path = catalog_path;
    }
    if (ledger_opt->count() > 0) {
        config.ledger_path = ledger_out;
    }
    if (compare_baseline) {
        config.compare_baseline = true;
    }
    if (strategy_opt->count() > 0) {
        config.default_strategies.clear();
        for (const auto& name : strategies) {
            auto kind = guardian::defense::ParseStrategyKind(name);
            if (!kind) {
                std::cerr << "Unknown strategy: " << name << std::endl;
                return 2;
            }
            config.default_strategies.push_back(*kind);
        }
    }

    guardian::LogConfig log_config;
    log_config.level = config.log_level;
    log_config.file_path = config.log_file;
    if (auto status = guardian::InitLogging(log_config); !status.ok()) {
        std::cerr << status.message() << std::endl;
        return 1;
    }
    GUARDIAN_LOG_INFO("{} starting", kVersion);

    auto engine_or = guardian::engine::DefenseEngine::Create(config);
    if (!engine_or.ok()) {
        // Never run with a partially loaded catalog
        GUARDIAN_LOG_CRITICAL("Startup aborted: {}",
                              std::string(engine_or.status().message()));
        guardian::ShutdownLogging();
        return 1;
    }
    auto& engine = **engine_or;

    // Collect prompts
    if (!prompt_file.empty()) {
        auto from_file = ReadPromptFile(prompt_file);
        if (!from_file.ok()) {
            GUARDIAN_LOG_ERROR("{}", std::string(from_file.status().message()));
            guardian::ShutdownLogging();
            return 1;
        }
        prompts.insert(prompts.end(), from_file->begin(), from_file->end());
    }
    if (demo) {
        for (const auto& example : guardian::catalog::AttackExamples()) {
            prompts.push_back(example.prompt);
        }
        for (const auto& benign : guardian::catalog::BenignExamples()) {
            prompts.push_back(benign);
        }
    }
    if (prompts.empty()) {
        GUARDIAN_LOG_ERROR("No prompts given (use --prompt, --prompt-file or --demo)");
        guardian::ShutdownLogging();
        return 2;
    }

    std::shared_ptr<guardian::provider::Provider> provider;
    if (use_provider) {
        guardian::provider::EchoProviderConfig provider_config;
        provider_config.delay = std::chrono::milliseconds(provider_delay_ms);
        provider = std::make_shared<guardian::provider::EchoProvider>(provider_config);
    }

    nlohmann::json output;
    output["catalog_version"] = engine.CurrentCatalog()->Version();
    output["results"] = nlohmann::json::array();

    int rejected = 0;
    for (const auto& prompt : prompts) {
        nlohmann::json entry;
        entry["prompt"] = prompt;
        entry["outcomes"] = nlohmann::json::array();

        auto outcomes = engine.ProcessWithDefaults(prompt, provider);
        if (!outcomes.ok()) {
            entry["error"] = std::string(outcomes.status().message());
            ++rejected;
        } else {
            for (const auto& outcome : *outcomes) {
                entry["outcomes"].push_back(SummarizeOutcome(outcome));
            }
        }
        output["results"].push_back(std::move(entry));
    }

    output["stats"] = guardian::ledger::LedgerStore::StatsToJson(engine.Ledger().Aggregate());
    // Prompts are arbitrary bytes; invalid UTF-8 is shown as U+FFFD here and
    // kept exactly in the ledger file
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;

    if (!config.ledger_path.empty()) {
        auto status = guardian::ledger::LedgerStore::SaveToFile(
            config.ledger_path, engine.Ledger().Outcomes());
        if (!status.ok()) {
            GUARDIAN_LOG_ERROR("Failed to save ledger: {}", std::string(status.message()));
            guardian::ShutdownLogging();
            return 1;
        }
    }

    GUARDIAN_LOG_INFO("Processed {} prompts ({} rejected)", prompts.size(), rejected);
    guardian::ShutdownLogging();
    return rejected > 0 ? 3 : 0;
}

/// @file defense_engine.cpp
/// @brief Defense engine implementation

#include "engine/defense_engine.h"

#include <future>
#include <string_view>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "scoring/effectiveness_scorer.h"

namespace guardian::engine {

namespace {

provider::ProviderExecutorConfig ExecutorConfig(const EngineConfig& config) {
    provider::ProviderExecutorConfig executor_config;
    executor_config.max_in_flight = config.provider_max_in_flight;
    executor_config.shutdown_grace = config.provider_shutdown_grace;
    return executor_config;
}

}  // namespace

DefenseEngine::DefenseEngine(std::shared_ptr<const catalog::Catalog> catalog,
                             EngineConfig config,
                             StrategyFactory strategy_factory)
    : config_(std::move(config)),
      strategy_factory_(std::move(strategy_factory)),
      catalog_(std::move(catalog)),
      pool_(std::make_unique<ThreadPool>(config_.worker_threads, "defense-engine")),
      provider_executor_(
          std::make_unique<provider::ProviderExecutor>(ExecutorConfig(config_))) {
    GUARDIAN_LOG_INFO("Defense engine ready: catalog {}, threshold {}, {} workers",
                      catalog_.Current()->Version(), config_.policy.threshold,
                      pool_->Size());
}

DefenseEngine::~DefenseEngine() {
    // Waits at most provider_shutdown_grace for abandoned provider calls
    provider_executor_->Shutdown();
    pool_->Shutdown();
}

absl::StatusOr<std::unique_ptr<DefenseEngine>> DefenseEngine::Create(EngineConfig config) {
    absl::StatusOr<std::shared_ptr<const catalog::Catalog>> catalog =
        config.catalog_path.empty() ? catalog::Catalog::Default()
                                    : catalog::Catalog::LoadFromFile(config.catalog_path);
    if (!catalog.ok()) {
        GUARDIAN_LOG_CRITICAL("Catalog load failed: {}",
                              std::string(catalog.status().message()));
        return catalog.status();
    }
    return std::make_unique<DefenseEngine>(std::move(*catalog), std::move(config));
}

std::shared_ptr<const detection::Detector> DefenseEngine::MakeDetector() const {
    return std::make_shared<detection::Detector>(catalog_.Current(), config_.policy);
}

DetectionResult DefenseEngine::Detect(std::string_view prompt) const {
    return MakeDetector()->Detect(prompt);
}

absl::StatusOr<Screening> DefenseEngine::Screen(const std::string& prompt,
                                                StrategyKind kind) const {
    auto detector = MakeDetector();
    auto strategy = strategy_factory_(kind, detector);
    if (!strategy) {
        return StrategyError(absl::StrCat("No strategy available for ",
                                          defense::StrategyKindToString(kind)));
    }

    Screening screening;
    screening.kind = kind;
    screening.strategy_name = strategy->Name();
    screening.original = detector->Detect(prompt);

    if (screening.original.is_flagged) {
        GUARDIAN_LOG_WARN("Prompt flagged: confidence {:.2f}, {} matches, primary {}",
                          screening.original.confidence,
                          screening.original.matches.size(),
                          screening.original.primary_pattern_id.value_or("-"));
    }

    auto transformed = strategy->Apply(prompt, screening.original);
    if (!transformed.ok()) {
        GUARDIAN_LOG_ERROR("Strategy {} rejected the submission: {}",
                           screening.strategy_name,
                           std::string(transformed.status().message()));
        return transformed.status();
    }

    screening.transformed_prompt = std::move(*transformed);
    screening.defended = detector->Detect(screening.transformed_prompt);
    screening.detector = std::move(detector);
    return screening;
}

DefenseOutcome DefenseEngine::Finalize(const Screening& screening,
                                       std::optional<std::string> provider_response,
                                       std::optional<std::string> provider_error,
                                       std::optional<std::string> baseline_response) {
    auto detector = screening.detector ? screening.detector : MakeDetector();
    scoring::EffectivenessScorer scorer(detector);

    auto view = [](const std::optional<std::string>& text) {
        return text ? std::optional<std::string_view>(*text) : std::nullopt;
    };

    DefenseOutcome outcome;
    outcome.strategy_name = screening.strategy_name;
    outcome.original = screening.original;
    outcome.transformed_prompt = screening.transformed_prompt;
    outcome.defended = screening.defended;
    outcome.metrics = scorer.Score(screening.original, screening.defended,
                                   view(provider_response), view(baseline_response));
    outcome.timestamp = std::chrono::system_clock::now();
    outcome.provider_response = std::move(provider_response);
    outcome.provider_error = std::move(provider_error);
    outcome.baseline_response = std::move(baseline_response);

    if (outcome.ConfidenceReduction() < 0.0) {
        GUARDIAN_LOG_WARN("Strategy {} increased detected risk by {:.2f}",
                          outcome.strategy_name, -outcome.ConfidenceReduction());
    }

    ledger_.Record(outcome);
    return outcome;
}

DefenseEngine::ProviderReply DefenseEngine::Await(const provider::Provider& provider,
                                                  const provider::PendingCall& call) {
    ProviderReply reply;
    auto result = call.Wait();
    if (!result.ok()) {
        GUARDIAN_LOG_WARN("Provider {} failed ({}): {}", provider.Name(),
                          ErrorCodeToString(GetErrorCode(result.status())),
                          std::string(result.status().message()));
        reply.error = result.status().ToString();
        return reply;
    }
    reply.response = std::move(*result);
    return reply;
}

absl::StatusOr<DefenseOutcome> DefenseEngine::Process(
    const std::string& prompt,
    StrategyKind kind,
    std::shared_ptr<provider::Provider> provider,
    std::chrono::milliseconds timeout) {
    GUARDIAN_ASSIGN_OR_RETURN(Screening screening, Screen(prompt, kind));
    if (!provider) {
        return Finalize(screening);
    }

    auto defended_call = provider_executor_->Start(provider, screening.transformed_prompt,
                                                   timeout);
    std::optional<provider::PendingCall> baseline_call;
    if (config_.compare_baseline) {
        baseline_call = provider_executor_->Start(provider, prompt, timeout);
    }

    ProviderReply defended = Await(*provider, defended_call);
    std::optional<std::string> baseline_response;
    if (baseline_call) {
        baseline_response = Await(*provider, *baseline_call).response;
    }
    return Finalize(screening, std::move(defended.response), std::move(defended.error),
                    std::move(baseline_response));
}

absl::StatusOr<DefenseOutcome> DefenseEngine::Process(
    const std::string& prompt,
    StrategyKind kind,
    std::shared_ptr<provider::Provider> provider) {
    return Process(prompt, kind, std::move(provider), config_.provider_timeout);
}

absl::StatusOr<std::vector<DefenseOutcome>> DefenseEngine::ProcessWithDefaults(
    const std::string& prompt,
    std::shared_ptr<provider::Provider> provider) {
    std::vector<Screening> screenings;
    screenings.reserve(config_.default_strategies.size());
    for (StrategyKind kind : config_.default_strategies) {
        GUARDIAN_ASSIGN_OR_RETURN(Screening screening, Screen(prompt, kind));
        screenings.push_back(std::move(screening));
    }

    std::vector<provider::PendingCall> calls;
    std::optional<provider::PendingCall> baseline_call;
    if (provider) {
        calls.reserve(screenings.size());
        for (const auto& screening : screenings) {
            calls.push_back(provider_executor_->Start(provider, screening.transformed_prompt,
                                                      config_.provider_timeout));
        }
        if (config_.compare_baseline) {
            baseline_call = provider_executor_->Start(provider, prompt,
                                                      config_.provider_timeout);
        }
    }

    std::optional<std::string> baseline_response;
    if (baseline_call) {
        baseline_response = Await(*provider, *baseline_call).response;
    }

    std::vector<DefenseOutcome> outcomes;
    outcomes.reserve(screenings.size());
    for (size_t i = 0; i < screenings.size(); ++i) {
        ProviderReply reply;
        if (provider) {
            reply = Await(*provider, calls[i]);
        }
        outcomes.push_back(Finalize(screenings[i], std::move(reply.response),
                                    std::move(reply.error), baseline_response));
    }
    return outcomes;
}

std::vector<absl::StatusOr<Screening>> DefenseEngine::ScreenBatch(
    const std::vector<std::string>& prompts,
    StrategyKind kind) {
    std::vector<std::future<absl::StatusOr<Screening>>> futures;
    futures.reserve(prompts.size());
    for (const auto& prompt : prompts) {
        futures.push_back(pool_->Submit([this, &prompt, kind]() {
            return Screen(prompt, kind);
        }));
    }

    std::vector<absl::StatusOr<Screening>> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

absl::Status DefenseEngine::ReloadCatalog(std::shared_ptr<const catalog::Catalog> catalog) {
    return catalog_.Swap(std::move(catalog));
}

absl::Status DefenseEngine::ReloadCatalogFromFile(const std::filesystem::path& path) {
    auto catalog = catalog::Catalog::LoadFromFile(path);
    if (!catalog.ok()) {
        GUARDIAN_LOG_ERROR("Catalog reload from {} failed, keeping {}: {}",
                           path.string(), catalog_.Current()->Version(),
                           std::string(catalog.status().message()));
        return catalog.status();
    }
    return catalog_.Swap(std::move(*catalog));
}

}  // namespace guardian::engine

#pragma once

/// @file defense_engine.h
/// @brief Orchestrates detection, defense, provider calls, scoring and the ledger
///
/// Shared state is limited to the catalog handle (swapped atomically) and the
/// session ledger (serialized appends). Everything else is computed per
/// submission, so any number of threads may screen concurrently.

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "catalog/catalog.h"
#include "catalog/catalog_handle.h"
#include "common/thread_pool.h"
#include "defense/strategy.h"
#include "detection/detector.h"
#include "engine/engine_config.h"
#include "ledger/defense_outcome.h"
#include "ledger/session_ledger.h"
#include "provider/provider.h"
#include "provider/provider_executor.h"

namespace guardian::engine {

using defense::StrategyKind;
using detection::DetectionResult;
using ledger::DefenseOutcome;

/// @brief A screened prompt awaiting its (optional) provider outcome
struct Screening {
    StrategyKind kind = StrategyKind::kComposite;
    std::string strategy_name;
    DetectionResult original;
    std::string transformed_prompt;
    DetectionResult defended;

    /// Detector both detections ran with; scoring reuses it so the provider
    /// response is checked against the same catalog snapshot
    std::shared_ptr<const detection::Detector> detector;
};

/// @brief Builds the strategy for a kind; defense::CreateStrategy by default
using StrategyFactory = std::function<std::unique_ptr<defense::DefenseStrategy>(
    StrategyKind, std::shared_ptr<const detection::Detector>)>;

/// @brief Defense engine
///
/// Example:
/// @code
///   auto engine = DefenseEngine::Create(config);
///   if (!engine.ok()) return 1;
///
///   auto provider = std::make_shared<provider::EchoProvider>();
///   auto outcome = (*engine)->Process(prompt, StrategyKind::kComposite, provider);
///   if (outcome.ok() && outcome->Attempted() && !outcome->Success()) {
///       // the defense did not neutralize the attack
///   }
///   auto stats = (*engine)->Ledger().Aggregate();
/// @endcode
class DefenseEngine {
public:
    DefenseEngine(std::shared_ptr<const catalog::Catalog> catalog,
                  EngineConfig config,
                  StrategyFactory strategy_factory = defense::CreateStrategy);
    ~DefenseEngine();

    // Disable copy
    DefenseEngine(const DefenseEngine&) = delete;
    DefenseEngine& operator=(const DefenseEngine&) = delete;

    /// @brief Load the configured catalog (built-in when no path is set) and
    ///        build an engine
    /// @return CatalogLoadError if the catalog cannot be loaded
    static absl::StatusOr<std::unique_ptr<DefenseEngine>> Create(EngineConfig config);

    /// @brief Detect against the current catalog
    DetectionResult Detect(std::string_view prompt) const;

    /// @brief Detect, apply the strategy, re-detect the result
    ///
    /// Both detections use the same catalog snapshot.
    /// @return StrategyError if the strategy violated an invariant; nothing
    ///         is recorded in that case
    absl::StatusOr<Screening> Screen(const std::string& prompt, StrategyKind kind) const;

    /// @brief Score a screening and record the outcome in the ledger
    /// @param provider_response Response to the transformed prompt, if any
    /// @param provider_error Why the response is absent, if known
    /// @param baseline_response Response to the original prompt, if any
    DefenseOutcome Finalize(const Screening& screening,
                            std::optional<std::string> provider_response = std::nullopt,
                            std::optional<std::string> provider_error = std::nullopt,
                            std::optional<std::string> baseline_response = std::nullopt);

    /// @brief Screen, call the provider with a bounded wait, score and record
    ///
    /// The provider runs on the engine's provider executor, never on the
    /// worker pool, and @p timeout counts from the moment the call starts. A
    /// provider error or a response that does not arrive in time leaves the
    /// provider outcome absent; scoring then uses the detections only. With
    /// compare_baseline the original prompt is sent too, concurrently.
    /// @p provider may be null.
    absl::StatusOr<DefenseOutcome> Process(const std::string& prompt,
                                           StrategyKind kind,
                                           std::shared_ptr<provider::Provider> provider,
                                           std::chrono::milliseconds timeout);

    /// @brief Process with the configured provider timeout
    absl::StatusOr<DefenseOutcome> Process(const std::string& prompt,
                                           StrategyKind kind,
                                           std::shared_ptr<provider::Provider> provider = nullptr);

    /// @brief One outcome per configured default strategy, in configured order
    ///
    /// Every strategy screens the prompt before anything else happens; if one
    /// fails, its StrategyError is returned and no outcome is recorded. The
    /// provider calls then run concurrently, with one shared baseline call.
    absl::StatusOr<std::vector<DefenseOutcome>> ProcessWithDefaults(
        const std::string& prompt,
        std::shared_ptr<provider::Provider> provider = nullptr);

    /// @brief Screen independent prompts concurrently; results keep input order
    std::vector<absl::StatusOr<Screening>> ScreenBatch(const std::vector<std::string>& prompts,
                                                       StrategyKind kind);

    /// @brief Swap in a new catalog; in-flight screenings keep their snapshot
    absl::Status ReloadCatalog(std::shared_ptr<const catalog::Catalog> catalog);

    /// @brief Load a catalog file and swap it in; the active catalog is kept
    ///        on failure
    absl::Status ReloadCatalogFromFile(const std::filesystem::path& path);

    std::shared_ptr<const catalog::Catalog> CurrentCatalog() const { return catalog_.Current(); }

    ledger::SessionLedger& Ledger() { return ledger_; }
    const ledger::SessionLedger& Ledger() const { return ledger_; }

    const EngineConfig& GetConfig() const { return config_; }

private:
    std::shared_ptr<const detection::Detector> MakeDetector() const;

    /// Response or failure of one provider call; exactly one is set
    struct ProviderReply {
        std::optional<std::string> response;
        std::optional<std::string> error;
    };

    static ProviderReply Await(const provider::Provider& provider,
                               const provider::PendingCall& call);

    EngineConfig config_;
    StrategyFactory strategy_factory_;
    catalog::CatalogHandle catalog_;
    ledger::SessionLedger ledger_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<provider::ProviderExecutor> provider_executor_;
};

}  // namespace guardian::engine

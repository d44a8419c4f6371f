#pragma once

/// @file session_ledger.h
/// @brief Append-only ledger of defense outcomes with derived statistics

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "catalog/attack_pattern.h"
#include "ledger/defense_outcome.h"

namespace guardian::ledger {

using catalog::AttackCategory;

/// @brief Counters for one strategy
struct StrategyStats {
    size_t applied = 0;     ///< Outcomes recorded for the strategy
    size_t attempted = 0;   ///< ... whose original prompt was flagged
    size_t succeeded = 0;   ///< ... and whose defended prompt was not
    size_t risk_increased = 0;  ///< Outcomes with a negative confidence reduction
    double total_confidence_reduction = 0.0;

    double SuccessRate() const {
        return attempted > 0 ? static_cast<double>(succeeded) / attempted : 0.0;
    }

    double AverageConfidenceReduction() const {
        return applied > 0 ? total_confidence_reduction / applied : 0.0;
    }

    bool operator==(const StrategyStats& other) const {
        return applied == other.applied && attempted == other.attempted &&
               succeeded == other.succeeded && risk_increased == other.risk_increased &&
               total_confidence_reduction == other.total_confidence_reduction;
    }
};

/// @brief Aggregate view of a ledger
struct LedgerStats {
    size_t total_submissions = 0;
    size_t total_attempts = 0;    ///< Outcomes whose original prompt was flagged
    size_t blocked_attempts = 0;  ///< Attempts the strategy neutralized
    size_t noop_submissions = 0;  ///< Unflagged prompts; never count as blocked

    /// Outcomes whose original detection has at least one match of the category
    std::map<AttackCategory, size_t> per_category;

    std::map<std::string, StrategyStats> per_strategy;

    /// @brief blocked / attempts, 0 when nothing was attempted
    double SuccessRate() const {
        return total_attempts > 0
                   ? static_cast<double>(blocked_attempts) / total_attempts
                   : 0.0;
    }

    bool operator==(const LedgerStats& other) const {
        return total_submissions == other.total_submissions &&
               total_attempts == other.total_attempts &&
               blocked_attempts == other.blocked_attempts &&
               noop_submissions == other.noop_submissions &&
               per_category == other.per_category &&
               per_strategy == other.per_strategy;
    }
    bool operator!=(const LedgerStats& other) const { return !(*this == other); }
};

/// @brief Append-only sequence of DefenseOutcome
///
/// Record() appends and folds the outcome into the running statistics under
/// one lock, so Aggregate() never observes a partially applied outcome. The
/// running statistics are produced by the same step as Fold(), which keeps
/// them identical to a fold over the stored sequence.
class SessionLedger {
public:
    SessionLedger() = default;

    // Disable copy
    SessionLedger(const SessionLedger&) = delete;
    SessionLedger& operator=(const SessionLedger&) = delete;

    /// @brief Append an outcome
    void Record(DefenseOutcome outcome);

    /// @brief Consistent snapshot of the running statistics
    LedgerStats Aggregate() const;

    /// @brief Snapshot copy of the recorded outcomes, in record order
    std::vector<DefenseOutcome> Outcomes() const;

    size_t Size() const;

    /// @brief Fold over a snapshot of the stored outcomes
    LedgerStats Recompute() const;

    /// @brief Pure fold of outcomes into statistics
    static LedgerStats Fold(const std::vector<DefenseOutcome>& outcomes);

    /// @brief Add one outcome to @p stats
    static void Accumulate(LedgerStats& stats, const DefenseOutcome& outcome);

private:
    mutable std::mutex mutex_;
    std::vector<DefenseOutcome> outcomes_;
    LedgerStats stats_;
};

}  // namespace guardian::ledger

/// @file session_ledger.cpp
/// @brief Session ledger implementation

#include "ledger/session_ledger.h"

namespace guardian::ledger {

void SessionLedger::Accumulate(LedgerStats& stats, const DefenseOutcome& outcome) {
    stats.total_submissions++;
    if (outcome.Attempted()) {
        stats.total_attempts++;
        if (outcome.Success()) {
            stats.blocked_attempts++;
        }
    } else {
        stats.noop_submissions++;
    }

    for (AttackCategory category : outcome.original.Categories()) {
        stats.per_category[category]++;
    }

    auto& strategy = stats.per_strategy[outcome.strategy_name];
    strategy.applied++;
    if (outcome.Attempted()) {
        strategy.attempted++;
        if (outcome.Success()) {
            strategy.succeeded++;
        }
    }
    if (outcome.ConfidenceReduction() < 0.0) {
        strategy.risk_increased++;
    }
    strategy.total_confidence_reduction += outcome.ConfidenceReduction();
}

LedgerStats SessionLedger::Fold(const std::vector<DefenseOutcome>& outcomes) {
    LedgerStats stats;
    for (const auto& outcome : outcomes) {
        Accumulate(stats, outcome);
    }
    return stats;
}

void SessionLedger::Record(DefenseOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
    Accumulate(stats_, outcomes_.back());
}

LedgerStats SessionLedger::Aggregate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<DefenseOutcome> SessionLedger::Outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

size_t SessionLedger::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}

LedgerStats SessionLedger::Recompute() const {
    return Fold(Outcomes());
}

}  // namespace guardian::ledger

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "sentinel/coordination/TradingSignal.hpp"

namespace sentinel::coordination {

struct CoordinatorOptions {
    size_t max_contenders = 5;
};

// Empty string when the signal is usable, otherwise why it was dropped.
std::string validateSignal(const TradingSignal& s);

ScoredSignal scoreSignal(
    const TradingSignal& s,
    const StrategyStats& stats
);

// True when a ranks ahead of b: higher score, then smaller strategy_id.
// NaN scores rank last.
bool ranksAhead(
    const ScoredSignal& a,
    const ScoredSignal& b
);

// ============================================================
// DecisionCoordinator
//
// Scores every strategy signal of a cycle and keeps one winner
// per symbol. Scoring is a pure function of the signals and the
// stats snapshot; the only state is the last-cycle audit.
// ============================================================
class DecisionCoordinator {
public:
    explicit DecisionCoordinator(
        CoordinatorOptions opts = CoordinatorOptions(),
        infra::WallClock clock = infra::systemClock()
    );

    std::vector<WinningIntent> pickWinningIntents(
        const std::vector<TradingSignal>& signals,
        const StatsSnapshot& stats
    );

    CycleAudit lastCycleAudit() const;
    CoordinatorStats stats() const;

private:
    WinningIntent formatWinner(
        const ScoredSignal& s,
        size_t contenders
    ) const;

    CoordinatorOptions opts;
    infra::WallClock clock;

    mutable std::mutex mtx;
    CycleAudit last_cycle;
    uint64_t cycles = 0;
    uint64_t total_signals = 0;
    uint64_t total_conflicts = 0;
    uint64_t total_winners = 0;
};

}

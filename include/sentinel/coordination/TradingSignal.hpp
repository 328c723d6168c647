#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/infra/Clock.hpp"

namespace sentinel::coordination {

enum class Side {
    BUY,
    SELL
};

const char* sideName(Side s);
std::optional<Side> parseSide(const std::string& s);

// One strategy's opinion on one symbol for one cycle.
struct TradingSignal {
    std::string symbol;
    Side side = Side::BUY;
    std::string strategy_id;
    double confidence = 1.0;
    double price = 0.0;
    double spread_bps = 0.0;
    double costs_est = 0.0;
    double quantity = 0.0;
};

// Trailing performance of one strategy. Defaults apply to strategies
// with no history.
struct StrategyStats {
    double profit_factor = 1.0;
    int64_t trades_count = 0;
    double win_rate = 0.5;
    double avg_win = 0.0;
    double avg_loss = 0.0;
};

using StatsSnapshot = std::map<std::string, StrategyStats>;

struct ScoringBreakdown {
    double after_cost_ev = 0.0;
    double reliability = 0.0;
    double liquidity = 0.0;
    double confidence = 0.0;
    double final_score = 0.0;
};

struct ScoredSignal {
    TradingSignal signal;
    double reliability = 0.0;
    double liquidity = 0.0;
    double after_cost_ev = 0.0;
    double score = 0.0;
    ScoringBreakdown breakdown;
    std::string rejection_reason;
};

struct IntentMeta {
    std::string reason = "coordinator_winner";
    double score = 0.0;
    double after_cost_ev = 0.0;
    double reliability = 0.0;
    double liquidity = 0.0;
    double confidence = 0.0;
    size_t contenders = 0;
};

struct WinningIntent {
    std::string key;            // symbol:side:strategy_id
    std::string symbol;
    Side side = Side::BUY;
    std::string strategy_id;
    double price = 0.0;
    double size_hint = 1.0;
    double score = 0.0;
    IntentMeta meta;
    ScoringBreakdown breakdown;
};

struct Contender {
    std::string strategy_id;
    double score = 0.0;
    std::string reason;
};

struct SymbolConflict {
    std::string symbol;
    size_t total_signals = 0;
    std::string winner;
    double top_score = 0.0;
    std::vector<Contender> contenders;   // at most 5
};

struct CycleAudit {
    infra::TimestampMs timestamp = 0;
    size_t raw_signals = 0;
    size_t invalid_signals = 0;
    size_t scored_signals = 0;
    size_t winners = 0;
    size_t rejects = 0;
    std::vector<WinningIntent> winner_details;
    std::vector<SymbolConflict> conflicts;
};

struct CoordinatorStats {
    uint64_t total_cycles = 0;
    double avg_signals_per_cycle = 0.0;
    double avg_conflicts_per_cycle = 0.0;
    double avg_winners_per_cycle = 0.0;
    infra::TimestampMs last_cycle_timestamp = 0;
};

}

#include "sentinel/coordination/DecisionCoordinator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>

namespace sentinel::coordination {

const char* sideName(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

std::optional<Side> parseSide(const std::string& s) {
    if (s == "buy" || s == "BUY" || s == "long") return Side::BUY;
    if (s == "sell" || s == "SELL" || s == "short") return Side::SELL;
    return std::nullopt;
}

std::string validateSignal(const TradingSignal& s) {
    if (s.symbol.empty()) return "empty symbol";
    if (s.strategy_id.empty()) return "empty strategy_id";
    if (!std::isfinite(s.confidence) ||
        !std::isfinite(s.price) ||
        !std::isfinite(s.spread_bps) ||
        !std::isfinite(s.costs_est) ||
        !std::isfinite(s.quantity)) {
        return "non-finite field";
    }
    if (s.confidence < 0.0 || s.confidence > 1.0) return "confidence outside [0,1]";
    if (s.price <= 0.0) return "non-positive price";
    return "";
}

ScoredSignal scoreSignal(
    const TradingSignal& s,
    const StrategyStats& stats
) {
    double trades = static_cast<double>(
        std::min<int64_t>(std::max<int64_t>(stats.trades_count, 0), 500)
    );
    double reliability = std::clamp(
        stats.profit_factor * (1.0 + trades / 1000.0),
        0.5, 2.0
    );

    double liquidity = std::clamp(
        1.0 - s.spread_bps / 10000.0,
        0.5, 1.5
    );

    double p_win = stats.win_rate;
    double avg_win = std::fabs(stats.avg_win);
    double avg_loss = std::fabs(stats.avg_loss);
    double ev = p_win * avg_win - (1.0 - p_win) * avg_loss - s.costs_est;

    ScoredSignal out;
    out.signal = s;
    out.reliability = reliability;
    out.liquidity = liquidity;
    out.after_cost_ev = ev;
    out.score = ev * reliability * liquidity * s.confidence;

    out.breakdown.after_cost_ev = ev;
    out.breakdown.reliability = reliability;
    out.breakdown.liquidity = liquidity;
    out.breakdown.confidence = s.confidence;
    out.breakdown.final_score = out.score;
    return out;
}

bool ranksAhead(
    const ScoredSignal& a,
    const ScoredSignal& b
) {
    bool a_nan = std::isnan(a.score);
    bool b_nan = std::isnan(b.score);
    if (a_nan != b_nan) return b_nan;
    if (!a_nan && a.score != b.score) return a.score > b.score;
    return a.signal.strategy_id < b.signal.strategy_id;
}

DecisionCoordinator::DecisionCoordinator(
    CoordinatorOptions opts,
    infra::WallClock clock
) : opts(opts),
    clock(std::move(clock)) {}

std::vector<WinningIntent> DecisionCoordinator::pickWinningIntents(
    const std::vector<TradingSignal>& signals,
    const StatsSnapshot& stats
) {
    CycleAudit audit;
    audit.timestamp = clock();
    audit.raw_signals = signals.size();

    // --- score ---
    const StrategyStats defaults;
    std::map<std::string, std::vector<ScoredSignal>> by_symbol;
    for (const TradingSignal& s : signals) {
        std::string why = validateSignal(s);
        if (!why.empty()) {
            ++audit.invalid_signals;
            std::cerr << "[COORD] dropped signal from "
                      << (s.strategy_id.empty() ? "?" : s.strategy_id)
                      << ": " << why << std::endl;
            continue;
        }
        auto it = stats.find(s.strategy_id);
        const StrategyStats& st = it != stats.end() ? it->second : defaults;
        by_symbol[s.symbol].push_back(scoreSignal(s, st));
        ++audit.scored_signals;
    }

    // --- one winner per symbol ---
    std::vector<WinningIntent> winners;
    for (auto& [symbol, group] : by_symbol) {
        std::sort(group.begin(), group.end(), ranksAhead);
        for (size_t i = 1; i < group.size(); ++i) {
            group[i].rejection_reason = "lower_score";
        }

        WinningIntent w = formatWinner(group.front(), group.size() - 1);
        winners.push_back(w);

        if (group.size() > 1) {
            SymbolConflict c;
            c.symbol = symbol;
            c.total_signals = group.size();
            c.winner = w.strategy_id;
            c.top_score = w.score;
            size_t last = std::min(group.size(), opts.max_contenders + 1);
            for (size_t i = 1; i < last; ++i) {
                c.contenders.push_back({
                    group[i].signal.strategy_id,
                    group[i].score,
                    group[i].rejection_reason
                });
            }
            audit.conflicts.push_back(std::move(c));
        }
    }

    audit.winners = winners.size();
    audit.rejects = audit.scored_signals - winners.size();
    audit.winner_details = winners;

    {
        std::lock_guard<std::mutex> lock(mtx);
        ++cycles;
        total_signals += audit.raw_signals;
        total_conflicts += audit.conflicts.size();
        total_winners += audit.winners;
        last_cycle = std::move(audit);
    }

    return winners;
}

WinningIntent DecisionCoordinator::formatWinner(
    const ScoredSignal& s,
    size_t contenders
) const {
    WinningIntent w;
    w.symbol = s.signal.symbol;
    w.side = s.signal.side;
    w.strategy_id = s.signal.strategy_id;
    w.key = s.signal.symbol + ":" + sideName(s.signal.side) + ":" + s.signal.strategy_id;
    w.price = s.signal.price;
    w.size_hint = s.signal.quantity > 0.0 ? s.signal.quantity : 1.0;
    w.score = s.score;
    w.breakdown = s.breakdown;

    w.meta.score = s.score;
    w.meta.after_cost_ev = s.after_cost_ev;
    w.meta.reliability = s.reliability;
    w.meta.liquidity = s.liquidity;
    w.meta.confidence = s.signal.confidence;
    w.meta.contenders = contenders;
    return w;
}

CycleAudit DecisionCoordinator::lastCycleAudit() const {
    std::lock_guard<std::mutex> lock(mtx);
    return last_cycle;
}

CoordinatorStats DecisionCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(mtx);
    CoordinatorStats s;
    s.total_cycles = cycles;
    s.last_cycle_timestamp = last_cycle.timestamp;
    if (cycles > 0) {
        double n = static_cast<double>(cycles);
        s.avg_signals_per_cycle = total_signals / n;
        s.avg_conflicts_per_cycle = total_conflicts / n;
        s.avg_winners_per_cycle = total_winners / n;
    }
    return s;
}

}

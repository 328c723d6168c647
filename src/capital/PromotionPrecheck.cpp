#include "sentinel/capital/PromotionPrecheck.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sentinel::capital {

namespace {

void check(
    PrecheckResult& r,
    const char* name,
    double value,
    double threshold,
    bool ok,
    const std::string& message
) {
    if (ok) return;
    PrecheckFailure f;
    f.check = name;
    f.value = value;
    f.threshold = threshold;
    f.message = message;
    r.failures.push_back(std::move(f));
}

std::string num(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

}

PrecheckResult precheckPromotion(
    const StrategyPerformance& perf,
    const PromotionThresholds& th
) {
    PrecheckResult r;

    // NaN fails every comparison below.
    check(r, "sharpe", perf.sharpe, th.min_sharpe,
          perf.sharpe >= th.min_sharpe,
          "Sharpe must be >= " + num(th.min_sharpe));
    check(r, "max_drawdown", perf.max_drawdown, th.max_drawdown,
          perf.max_drawdown <= th.max_drawdown,
          "MaxDD must be <= " + num(th.max_drawdown * 100.0) + "%");
    check(r, "win_rate", perf.win_rate, th.min_win_rate,
          perf.win_rate >= th.min_win_rate,
          "Win rate must be >= " + num(th.min_win_rate * 100.0) + "%");
    check(r, "trade_count", static_cast<double>(perf.trade_count), static_cast<double>(th.min_trades),
          perf.trade_count >= th.min_trades,
          "Must have >= " + std::to_string(th.min_trades) + " trades");
    check(r, "avg_slippage_bps", perf.avg_slippage_bps, th.max_avg_slippage_bps,
          perf.avg_slippage_bps <= th.max_avg_slippage_bps,
          "Avg slippage must be <= " + num(th.max_avg_slippage_bps) + " bps");
    check(r, "trace_completeness", perf.trace_completeness, th.min_trace_completeness,
          perf.trace_completeness >= th.min_trace_completeness,
          "Trace completeness must be >= " + num(th.min_trace_completeness * 100.0) + "%");

    r.pass = r.failures.empty();
    if (r.pass) {
        r.score = std::round(perf.sharpe * 100.0) / 100.0;
    }
    return r;
}

double computePoolCap(
    const PoolCapParams& p,
    double prod_sharpe_20d,
    double prod_drawdown
) {
    double bonus = prod_sharpe_20d >= p.sharpe_threshold ? p.sharpe_bonus : 0.0;
    // Unknown drawdown takes the full penalty.
    double penalty = p.penalty_cap;
    if (std::isfinite(prod_drawdown)) {
        penalty = std::min(std::max(prod_drawdown, 0.0) * p.drawdown_multiplier, p.penalty_cap);
    }
    double cap = std::clamp(p.base + bonus - penalty, p.min_cap, p.max_cap);
    return std::round(cap * 10000.0) / 10000.0;
}

}

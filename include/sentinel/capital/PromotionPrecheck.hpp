#pragma once

#include "sentinel/capital/AllocationTypes.hpp"

namespace sentinel::capital {

struct PromotionThresholds {
    double min_sharpe = 1.2;
    double max_drawdown = 0.12;
    double min_win_rate = 0.52;
    int64_t min_trades = 25;
    double max_avg_slippage_bps = 10.0;
    double min_trace_completeness = 0.98;
};

// Risk thermostat inputs.
struct PoolCapParams {
    double base = 0.05;
    double sharpe_bonus = 0.02;
    double sharpe_threshold = 1.2;
    double drawdown_multiplier = 2.0;
    double penalty_cap = 0.02;
    double min_cap = 0.03;
    double max_cap = 0.10;
};

// Every threshold is checked; all failures are listed.
PrecheckResult precheckPromotion(
    const StrategyPerformance& perf,
    const PromotionThresholds& th
);

// clamp(base + bonus - min(dd * k, penalty_cap), min, max), 4 decimals.
double computePoolCap(
    const PoolCapParams& p,
    double prod_sharpe_20d,
    double prod_drawdown
);

inline double computePoolCap(
    const PoolCapParams& p,
    const ProductionMetrics& m
) {
    return computePoolCap(p, m.sharpe_20d, m.drawdown);
}

}

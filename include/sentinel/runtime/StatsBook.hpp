#pragma once

#include <mutex>
#include <string>

#include "sentinel/coordination/TradingSignal.hpp"

namespace sentinel::runtime {

// Strategy stats shared between the feed and the coordination cycle.
// Each cycle scores against one copied snapshot.
class StatsBook {
public:
    void update(
        const std::string& strategy_id,
        const coordination::StrategyStats& stats
    );

    coordination::StatsSnapshot snapshot() const;

private:
    mutable std::mutex mtx;
    coordination::StatsSnapshot stats;
};

}

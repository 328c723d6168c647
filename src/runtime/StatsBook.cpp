#include "sentinel/runtime/StatsBook.hpp"

namespace sentinel::runtime {

void StatsBook::update(
    const std::string& strategy_id,
    const coordination::StrategyStats& s
) {
    std::lock_guard<std::mutex> lock(mtx);
    stats[strategy_id] = s;
}

coordination::StatsSnapshot StatsBook::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return stats;
}

}

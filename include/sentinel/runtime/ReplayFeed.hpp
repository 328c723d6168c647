#pragma once

#include <string>
#include <vector>

#include "sentinel/audit/AuditRecords.hpp"
#include "sentinel/capital/AllocationTypes.hpp"
#include "sentinel/coordination/TradingSignal.hpp"
#include "sentinel/core/Greeks.hpp"

namespace sentinel::runtime {

enum class FeedEventType {
    QUOTE,
    CHAIN,
    SIGNAL,
    STATS,
    STAGE,
    HEARTBEAT,
    CYCLE,
    REBALANCE,
    PRODUCTION,
    GREEKS,
    KILL
};

const char* toString(FeedEventType t);

// One line of a replay file. Only the members belonging to `type`
// carry data.
struct FeedEvent {
    FeedEventType type = FeedEventType::CYCLE;

    audit::QuoteRecord quote;
    audit::ChainLegRecord chain_leg;
    coordination::TradingSignal signal;
    std::string strategy_id;
    coordination::StrategyStats stats;
    capital::StageRequest stage;
    capital::ProductionMetrics production;
    Greeks greeks;
    std::string consistency_token;
    bool preview = false;
    std::string reason;
};

// Throws std::invalid_argument on malformed lines.
FeedEvent parseFeedEvent(const std::string& line);

// JSON-lines event source for paper sessions and tests. Bad lines are
// logged and skipped; an unreadable file throws ConfigError.
class ReplayFeed {
public:
    explicit ReplayFeed(std::string path);

    std::vector<FeedEvent> load();

    size_t skipped() const { return bad_lines; }
    const std::string& path() const { return file; }

private:
    std::string file;
    size_t bad_lines = 0;
};

}

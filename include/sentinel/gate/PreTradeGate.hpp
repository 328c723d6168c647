#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/infra/Clock.hpp"

namespace sentinel::gate {

struct GateLimits {
    double quote_stale_sec = 10.0;
    double broker_stale_sec = 15.0;
    double max_portfolio_heat = 0.10;
    double max_strategy_heat = 0.05;
};

// Snapshot of everything the gate looks at. Health fields are optional:
// an absent value means the feed never reported and is treated as stale.
struct GateContext {
    double nav = 0.0;
    double portfolio_heat = 0.0;
    double strategy_heat = 0.0;
    double dd_mult = 1.0;
    double requested_qty = 0.0;
    double price = 0.0;
    double available_cash = 0.0;
    std::optional<double> quote_age_s;
    std::optional<double> broker_age_s;
    bool stale = false;
};

enum class GateVerdict {
    ACCEPT,
    REJECT
};

enum class GateReason {
    NONE,
    STALE_DATA,
    PORTFOLIO_HEAT,
    STRATEGY_HEAT,
    INVALID_INPUT,
    INSUFFICIENT_CASH,
    SIZE_ZERO
};

const char* toString(GateVerdict v);
const char* toString(GateReason r);

struct GateDecision {
    GateVerdict decision = GateVerdict::REJECT;
    GateReason reason = GateReason::NONE;
    std::string message;
    double routed_qty = 0.0;

    bool accepted() const { return decision == GateVerdict::ACCEPT; }
};

// Stateless admission check. Rules run in a fixed order and the first
// failing one decides. Never throws.
GateDecision preTradeGate(
    const GateContext& ctx,
    const GateLimits& limits
);

struct GateRejection {
    infra::TimestampMs ts = 0;
    std::string symbol;
    std::string strategy_id;
    GateReason reason = GateReason::NONE;
    std::string message;
};

// Bounded history of recent rejections, kept beside the gate.
class GateRejectionLog {
public:
    explicit GateRejectionLog(size_t capacity = 100);

    void add(GateRejection r);
    std::vector<GateRejection> recent() const;
    size_t size() const;

private:
    size_t capacity;
    mutable std::mutex mtx;
    std::deque<GateRejection> entries;
};

}

#include "sentinel/gate/PreTradeGate.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sentinel::gate {

const char* toString(GateVerdict v) {
    return v == GateVerdict::ACCEPT ? "ACCEPT" : "REJECT";
}

const char* toString(GateReason r) {
    switch (r) {
        case GateReason::NONE: return "NONE";
        case GateReason::STALE_DATA: return "STALE_DATA";
        case GateReason::PORTFOLIO_HEAT: return "PORTFOLIO_HEAT";
        case GateReason::STRATEGY_HEAT: return "STRATEGY_HEAT";
        case GateReason::INVALID_INPUT: return "INVALID_INPUT";
        case GateReason::INSUFFICIENT_CASH: return "INSUFFICIENT_CASH";
        case GateReason::SIZE_ZERO: return "SIZE_ZERO";
    }
    return "UNKNOWN";
}

static GateDecision reject(
    GateReason reason,
    const std::string& message
) {
    GateDecision d;
    d.decision = GateVerdict::REJECT;
    d.reason = reason;
    d.message = message;
    d.routed_qty = 0.0;
    return d;
}

static bool staleAge(
    const std::optional<double>& age,
    double limit
) {
    if (!age || !std::isfinite(*age)) return true;
    return *age > limit;
}

GateDecision preTradeGate(
    const GateContext& ctx,
    const GateLimits& limits
) {
    // 1. staleness, fail closed on missing health
    if (ctx.stale ||
        staleAge(ctx.quote_age_s, limits.quote_stale_sec) ||
        staleAge(ctx.broker_age_s, limits.broker_stale_sec)) {
        std::ostringstream msg;
        msg << "market/broker data stale or missing (quote_age_s=";
        if (ctx.quote_age_s) msg << *ctx.quote_age_s; else msg << "none";
        msg << ", broker_age_s=";
        if (ctx.broker_age_s) msg << *ctx.broker_age_s; else msg << "none";
        msg << ", stale=" << (ctx.stale ? "true" : "false") << ")";
        return reject(GateReason::STALE_DATA, msg.str());
    }

    // 2-3. heat caps; NaN heat never passes
    if (!(ctx.portfolio_heat < limits.max_portfolio_heat)) {
        std::ostringstream msg;
        msg << "portfolio heat " << ctx.portfolio_heat
            << " >= cap " << limits.max_portfolio_heat;
        return reject(GateReason::PORTFOLIO_HEAT, msg.str());
    }
    if (!(ctx.strategy_heat < limits.max_strategy_heat)) {
        std::ostringstream msg;
        msg << "strategy heat " << ctx.strategy_heat
            << " >= cap " << limits.max_strategy_heat;
        return reject(GateReason::STRATEGY_HEAT, msg.str());
    }

    if (!std::isfinite(ctx.requested_qty) ||
        !std::isfinite(ctx.price) ||
        !std::isfinite(ctx.available_cash) ||
        !std::isfinite(ctx.dd_mult)) {
        return reject(GateReason::INVALID_INPUT, "non-finite qty, price, cash or dd_mult");
    }

    // 4. cash
    double notional = std::fabs(ctx.requested_qty * ctx.price);
    if (notional > ctx.available_cash) {
        std::ostringstream msg;
        msg << "notional " << notional
            << " exceeds available cash " << ctx.available_cash;
        return reject(GateReason::INSUFFICIENT_CASH, msg.str());
    }

    // 5. drawdown-scaled size
    if (ctx.requested_qty <= 0.0) {
        return reject(GateReason::SIZE_ZERO, "requested quantity is not positive");
    }
    double routed = std::clamp(
        ctx.requested_qty * ctx.dd_mult,
        0.0,
        ctx.requested_qty
    );
    if (routed <= 0.0) {
        std::ostringstream msg;
        msg << "drawdown multiplier " << ctx.dd_mult
            << " scales size to zero";
        return reject(GateReason::SIZE_ZERO, msg.str());
    }

    GateDecision d;
    d.decision = GateVerdict::ACCEPT;
    d.reason = GateReason::NONE;
    d.routed_qty = routed;
    std::ostringstream msg;
    msg << "accepted qty " << routed << " of " << ctx.requested_qty;
    d.message = msg.str();
    return d;
}

// --- GateRejectionLog ---

GateRejectionLog::GateRejectionLog(size_t capacity)
    : capacity(capacity) {}

void GateRejectionLog::add(GateRejection r) {
    std::lock_guard<std::mutex> lock(mtx);
    entries.push_back(std::move(r));
    while (entries.size() > capacity) {
        entries.pop_front();
    }
}

std::vector<GateRejection> GateRejectionLog::recent() const {
    std::lock_guard<std::mutex> lock(mtx);
    return std::vector<GateRejection>(entries.begin(), entries.end());
}

size_t GateRejectionLog::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

}

#include "sentinel/runtime/PaperBroker.hpp"

#include "sentinel/core/Errors.hpp"
#include "sentinel/infra/Sha256.hpp"

#include <cmath>
#include <iostream>

namespace sentinel::runtime {

PaperBroker::PaperBroker(
    const audit::AuditStore& store,
    int64_t max_quote_age_ms,
    double fee_per_unit,
    infra::WallClock clock
) : store(store),
    max_quote_age_ms(max_quote_age_ms),
    fee_per_unit(fee_per_unit),
    clock(std::move(clock)) {}

BrokerFill PaperBroker::submit(const BrokerOrder& order) {
    if (!connected.load()) {
        throw BrokerError("paper broker disconnected");
    }
    if (!(order.qty > 0.0)) {
        throw BrokerError("order " + order.plan_id + " has no quantity");
    }

    infra::TimestampMs now = clock();
    std::optional<audit::QuoteRecord> q;
    try {
        q = store.latestFreshQuote(order.symbol, max_quote_age_ms, now);
    } catch (const StoreError& e) {
        throw BrokerError(std::string("no market: ") + e.what());
    }
    if (!q || q->mid <= 0.0) {
        throw BrokerError("no fresh two-sided quote for " + order.symbol);
    }

    BrokerFill f;
    f.plan_id = order.plan_id;
    f.symbol = order.symbol;
    f.side = order.side;
    f.price = q->mid;
    f.qty = order.qty;
    f.fees = std::fabs(order.qty) * fee_per_unit;
    f.ts_fill = now;

    uint64_t n = ++fills;
    f.broker_attestation = "paper:" + infra::sha256Hex(
        order.plan_id + "|" + std::to_string(n) + "|" + std::to_string(now)
    ).substr(0, 16);

    std::cout << "[PAPER] " << f.side << " " << f.qty << " " << f.symbol
              << " @ " << f.price << " plan=" << f.plan_id << std::endl;
    return f;
}

}

#pragma once

#include <string>

#include "sentinel/coordination/TradingSignal.hpp"
#include "sentinel/infra/Clock.hpp"

namespace sentinel::runtime {

struct BrokerOrder {
    std::string plan_id;
    std::string symbol;
    std::string side;           // BUY_TO_OPEN / SELL_TO_CLOSE
    double qty = 0.0;
    double limit_price = 0.0;
};

struct BrokerFill {
    std::string plan_id;
    std::string symbol;
    std::string side;
    double price = 0.0;
    double qty = 0.0;
    double fees = 0.0;
    infra::TimestampMs ts_fill = 0;
    std::string broker_attestation;
};

// Execution boundary. submit() either returns a confirmed fill or
// throws BrokerError; there is no partial-success path.
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual BrokerFill submit(const BrokerOrder& order) = 0;
    virtual bool heartbeat() = 0;
    virtual std::string name() const = 0;
};

}

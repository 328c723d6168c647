#pragma once

#include <atomic>
#include <string>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/runtime/BrokerGateway.hpp"

namespace sentinel::runtime {

// Simulated broker filling at the recorded NBBO mid.
class PaperBroker : public IBrokerGateway {
public:
    PaperBroker(
        const audit::AuditStore& store,
        int64_t max_quote_age_ms = 10 * 1000,
        double fee_per_unit = 0.0,
        infra::WallClock clock = infra::systemClock()
    );

    BrokerFill submit(const BrokerOrder& order) override;
    bool heartbeat() override { return connected.load(); }
    std::string name() const override { return "paper"; }

    void setConnected(bool up) { connected.store(up); }

private:
    const audit::AuditStore& store;
    int64_t max_quote_age_ms;
    double fee_per_unit;
    infra::WallClock clock;
    std::atomic<bool> connected{true};
    std::atomic<uint64_t> fills{0};
};

}

#pragma once

#include <mutex>
#include <optional>

#include "sentinel/infra/Clock.hpp"

namespace sentinel::runtime {

struct HealthSnapshot {
    std::optional<double> quote_age_s;
    std::optional<double> broker_age_s;
    bool stale = false;
};

// Last-seen times of the market feed and the broker. A source that
// never reported has no age, which the gate treats as stale.
class HealthMonitor {
public:
    void onQuote(infra::TimestampMs ts_recv);
    void onBrokerHeartbeat(infra::TimestampMs ts);
    void setStale(bool stale);

    HealthSnapshot snapshot(infra::TimestampMs now) const;

private:
    mutable std::mutex mtx;
    std::optional<infra::TimestampMs> last_quote;
    std::optional<infra::TimestampMs> last_broker;
    bool stale_flag = false;
};

}

#include "sentinel/runtime/HealthMonitor.hpp"

#include <algorithm>

namespace sentinel::runtime {

void HealthMonitor::onQuote(infra::TimestampMs ts_recv) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!last_quote || ts_recv > *last_quote) {
        last_quote = ts_recv;
    }
}

void HealthMonitor::onBrokerHeartbeat(infra::TimestampMs ts) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!last_broker || ts > *last_broker) {
        last_broker = ts;
    }
}

void HealthMonitor::setStale(bool stale) {
    std::lock_guard<std::mutex> lock(mtx);
    stale_flag = stale;
}

HealthSnapshot HealthMonitor::snapshot(infra::TimestampMs now) const {
    std::lock_guard<std::mutex> lock(mtx);
    HealthSnapshot s;
    s.stale = stale_flag;
    if (last_quote) {
        s.quote_age_s = std::max<infra::TimestampMs>(now - *last_quote, 0) / 1000.0;
    }
    if (last_broker) {
        s.broker_age_s = std::max<infra::TimestampMs>(now - *last_broker, 0) / 1000.0;
    }
    return s;
}

}

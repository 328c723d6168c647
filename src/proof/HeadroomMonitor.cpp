#include "sentinel/proof/HeadroomMonitor.hpp"

#include <iostream>

namespace sentinel::proof {

HeadroomMonitor::HeadroomMonitor(
    size_t critical_after,
    infra::WallClock clock
) : critical_after(critical_after),
    clock(std::move(clock)) {
    session_start = this->clock();
}

size_t HeadroomMonitor::recordWarning(
    const std::string& trade_id,
    const std::vector<std::string>& greeks
) {
    std::lock_guard<std::mutex> lock(mtx);

    HeadroomWarning w;
    w.ts = clock();
    w.trade_id = trade_id;
    w.greeks = greeks;
    log.push_back(std::move(w));

    size_t n = log.size();
    if (n >= critical_after) {
        std::cerr << "[PROVER] CRITICAL greeks headroom under buffer "
                  << n << " times this session (since "
                  << infra::toIso8601(session_start) << "), trade "
                  << trade_id << std::endl;
    }
    return n;
}

bool HeadroomMonitor::critical() const {
    std::lock_guard<std::mutex> lock(mtx);
    return log.size() >= critical_after;
}

size_t HeadroomMonitor::count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return log.size();
}

infra::TimestampMs HeadroomMonitor::sessionStart() const {
    std::lock_guard<std::mutex> lock(mtx);
    return session_start;
}

std::vector<HeadroomWarning> HeadroomMonitor::warnings() const {
    std::lock_guard<std::mutex> lock(mtx);
    return log;
}

void HeadroomMonitor::reset() {
    std::lock_guard<std::mutex> lock(mtx);
    log.clear();
    session_start = clock();
}

}

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "sentinel/infra/Clock.hpp"

namespace sentinel::proof {

struct HeadroomWarning {
    infra::TimestampMs ts = 0;
    std::string trade_id;
    std::vector<std::string> greeks;
};

// Counts Greeks-headroom buffer violations for one session. The
// session lasts as long as this object; nothing is persisted and only
// reset() clears the count.
class HeadroomMonitor {
public:
    explicit HeadroomMonitor(
        size_t critical_after = 2,
        infra::WallClock clock = infra::systemClock()
    );

    // Returns the session count including this warning.
    size_t recordWarning(
        const std::string& trade_id,
        const std::vector<std::string>& greeks
    );

    bool critical() const;
    size_t count() const;
    infra::TimestampMs sessionStart() const;
    std::vector<HeadroomWarning> warnings() const;

    void reset();

private:
    size_t critical_after;
    infra::WallClock clock;

    mutable std::mutex mtx;
    infra::TimestampMs session_start;
    std::vector<HeadroomWarning> log;
};

}

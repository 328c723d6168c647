#pragma once

#include <string>

#include "sentinel/audit/AuditRecords.hpp"

namespace sentinel::audit {

// Builds the provenance stamp attached to each record.
class AuditStamper {
public:
    AuditStamper(
        std::string commit_hash,
        std::string policy_hash,
        std::string environment,
        bool worm_mode = true,
        infra::WallClock clock = infra::systemClock()
    );

    AuditStamp stamp(
        TimestampMs ts_feed,
        TimestampMs ts_recv
    ) const;

    TimestampMs now() const { return clock(); }

    const std::string& policyHash() const { return policy_hash; }
    const std::string& environment() const { return env; }

private:
    std::string commit_hash;
    std::string policy_hash;
    std::string env;
    bool worm_mode;
    infra::WallClock clock;
};

}

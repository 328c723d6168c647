#include "sentinel/audit/AuditStamper.hpp"

namespace sentinel::audit {

AuditStamper::AuditStamper(
    std::string commit_hash,
    std::string policy_hash,
    std::string environment,
    bool worm_mode,
    infra::WallClock clock
) : commit_hash(std::move(commit_hash)),
    policy_hash(std::move(policy_hash)),
    env(std::move(environment)),
    worm_mode(worm_mode),
    clock(std::move(clock)) {}

AuditStamp AuditStamper::stamp(
    TimestampMs ts_feed,
    TimestampMs ts_recv
) const {
    AuditStamp s;
    s.server_ts = clock();
    s.ts_feed = ts_feed;
    s.ts_recv = ts_recv;
    s.commit_hash = commit_hash;
    s.policy_hash = policy_hash;
    s.environment = env;
    s.worm_mode = worm_mode;
    return s;
}

}

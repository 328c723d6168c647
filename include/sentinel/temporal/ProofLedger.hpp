#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "sentinel/infra/Clock.hpp"
#include "sentinel/proof/ProofTypes.hpp"

namespace sentinel::temporal {

using infra::TimestampMs;

// Compact result of one post-trade proof.
struct ProofOutcome {
    std::string trade_id;
    std::string plan_id;
    std::string symbol;
    std::string route;
    TimestampMs ts = 0;
    bool passed = false;
    bool promise_ok = false;
    bool slippage_within = false;
    bool using_fallback = false;
    std::vector<std::string> reasons;
};

// Pool utilisation seen at a rebalance.
struct CapSnapshot {
    TimestampMs ts = 0;
    double used = 0.0;
    double cap = 0.0;
};

ProofOutcome summarizeProof(
    const proof::Proof& p,
    const proof::PostTradeFact& fact,
    const std::string& route
);

// In-memory history of proof outcomes and cap snapshots that the
// summarizer reduces over. Entries older than retention_ms behind the
// newest one are dropped on append.
class ProofLedger {
public:
    explicit ProofLedger(int64_t retention_ms = 7 * infra::MS_PER_DAY);

    void append(ProofOutcome o);
    void appendCap(CapSnapshot s);

    std::vector<ProofOutcome> outcomes(
        TimestampMs start,
        TimestampMs end
    ) const;

    std::vector<CapSnapshot> caps(
        TimestampMs start,
        TimestampMs end
    ) const;

    size_t size() const;
    size_t capCount() const;

private:
    void prune();

    int64_t retention_ms;
    TimestampMs newest = 0;
    mutable std::mutex mtx;
    std::vector<ProofOutcome> proofs;
    std::vector<CapSnapshot> cap_history;
};

}

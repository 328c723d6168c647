#include "sentinel/temporal/ProofLedger.hpp"

#include <algorithm>

namespace sentinel::temporal {

ProofOutcome summarizeProof(
    const proof::Proof& p,
    const proof::PostTradeFact& fact,
    const std::string& route
) {
    ProofOutcome o;
    o.trade_id = p.trade_id;
    o.plan_id = fact.planKey();
    o.symbol = fact.symbol;
    o.route = route;
    o.ts = fact.timestamp;
    o.passed = p.overall.passed;
    o.promise_ok = p.promise.passed;
    o.slippage_within = p.promise.passed && p.slippage_within_plan.within;
    o.using_fallback = p.slippage_within_plan.using_fallback;
    o.reasons = p.overall.reasons;
    return o;
}

ProofLedger::ProofLedger(int64_t retention_ms)
    : retention_ms(retention_ms) {}

void ProofLedger::append(ProofOutcome o) {
    std::lock_guard<std::mutex> lock(mtx);
    newest = std::max(newest, o.ts);
    proofs.push_back(std::move(o));
    prune();
}

void ProofLedger::appendCap(CapSnapshot s) {
    std::lock_guard<std::mutex> lock(mtx);
    newest = std::max(newest, s.ts);
    cap_history.push_back(s);
    prune();
}

// Caller holds mtx.
void ProofLedger::prune() {
    TimestampMs horizon = newest - retention_ms;
    proofs.erase(
        std::remove_if(proofs.begin(), proofs.end(),
                       [horizon](const ProofOutcome& o) { return o.ts < horizon; }),
        proofs.end());
    cap_history.erase(
        std::remove_if(cap_history.begin(), cap_history.end(),
                       [horizon](const CapSnapshot& c) { return c.ts < horizon; }),
        cap_history.end());
}

std::vector<ProofOutcome> ProofLedger::outcomes(
    TimestampMs start,
    TimestampMs end
) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ProofOutcome> out;
    for (const ProofOutcome& o : proofs) {
        if (o.ts >= start && o.ts < end) {
            out.push_back(o);
        }
    }
    return out;
}

std::vector<CapSnapshot> ProofLedger::caps(
    TimestampMs start,
    TimestampMs end
) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<CapSnapshot> out;
    for (const CapSnapshot& s : cap_history) {
        if (s.ts >= start && s.ts < end) {
            out.push_back(s);
        }
    }
    return out;
}

size_t ProofLedger::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return proofs.size();
}

size_t ProofLedger::capCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cap_history.size();
}

}

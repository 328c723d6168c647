#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/proof/HeadroomMonitor.hpp"
#include "sentinel/proof/ProofTypes.hpp"

namespace sentinel::proof {

struct ProverLimits {
    double max_slippage_multiplier = 1.5;
    double min_fill_pct = 0.8;
    double net_debit_tolerance = 0.01;
    double cost_tolerance_pct = 0.05;
    double greeks_drift_max = 0.02;
    double headroom_buffer = 0.95;
    int64_t nbbo_tolerance_ms = 1000;
    double leveraged_etf_bonus = 0.0001;
    std::vector<std::string> leveraged_etf_symbols = {"SOXL", "SOXU"};
    bool require_nbbo = false;
};

// ============================================================
// PostTradeProver
//
// Checks an executed fill against the pre-trade promise. Each
// sub-proof is evaluated independently; overall passes only if
// every sub-proof passes. Slippage is measured against the NBBO
// recorded in the audit store, not the broker's own number.
//
// A missing or malformed promise never passes.
// ============================================================
class PostTradeProver {
public:
    PostTradeProver(
        const audit::AuditStore* store,
        HeadroomMonitor& headroom,
        ProverLimits limits = ProverLimits(),
        infra::WallClock clock = infra::systemClock()
    );

    Proof verifyExecution(
        const std::optional<PreTradePromise>& promise,
        const PostTradeFact& fact
    ) const;

    const ProverLimits& limits() const { return lim; }

    // --- individual sub-proofs ---
    ExecutionProof proveExecutionBounds(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

    StructureProof proveStructureBounds(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

    CashProof proveCashBounds(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

    GreeksDriftProof proveGreeksDrift(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

    NetDebitProof proveNetDebitOnly(const PostTradeFact& f) const;

    SidesProof proveSidesOK(const PostTradeFact& f) const;

    SlippageProof proveSlippageWithinPlan(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

    GreeksCapsProof proveGreeksCapsWithin(
        const PreTradePromise& p,
        const PostTradeFact& f
    ) const;

private:
    double leveragedBonus(const std::string& symbol) const;

    const audit::AuditStore* store;
    HeadroomMonitor& headroom;
    ProverLimits lim;
    infra::WallClock clock;
};

std::string formatProofSummary(
    const Proof& proof,
    const ProverLimits& limits = ProverLimits()
);

}

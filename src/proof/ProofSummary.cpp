#include "sentinel/proof/PostTradeProver.hpp"

#include <iomanip>
#include <sstream>

namespace sentinel::proof {

std::string formatProofSummary(
    const Proof& proof,
    const ProverLimits& limits
) {
    std::ostringstream os;
    os << std::fixed;
    os << "Post-Trade Proof: " << (proof.overall.passed ? "PASSED" : "FAILED") << "\n";
    os << "Trade ID: " << proof.trade_id << "\n";
    os << "Verified: " << infra::toIso8601(proof.verified_at) << "\n";
    os << "Policy: " << proof.stamp.policy_hash
       << " (" << proof.stamp.environment << ")\n\n";

    if (!proof.promise.passed) {
        os << "Promise: " << proof.promise.reasons.front() << "\n";
    } else {
        os << "Execution Bounds:\n";
        os << "  Fill: " << std::setprecision(1) << proof.execution.fill_pct * 100.0
           << "% (min " << limits.min_fill_pct * 100.0 << "%)\n";
        os << "  Slippage: " << std::setprecision(3) << proof.execution.actual_slippage
           << " (max " << proof.execution.planned_slippage * limits.max_slippage_multiplier << ")\n";

        os << "Structure Bounds:\n";
        os << "  Net Debit: $" << std::setprecision(2) << proof.structure.actual_net_debit
           << " (promised $" << proof.structure.promised_net_debit << ")\n";

        os << "Cash Bounds:\n";
        os << "  Cost: $" << proof.cash.actual_cost
           << " (promised $" << proof.cash.promised_cost << ")\n";

        os << "Greeks Drift:\n";
        os << std::setprecision(1);
        os << "  delta: " << proof.greeks.drift_percentages.delta * 100.0
           << "% (max " << limits.greeks_drift_max * 100.0 << "%)\n";
        os << "  theta: " << proof.greeks.drift_percentages.theta * 100.0
           << "% (max " << limits.greeks_drift_max * 100.0 << "%)\n";
        os << "  vega: " << proof.greeks.drift_percentages.vega * 100.0
           << "% (max " << limits.greeks_drift_max * 100.0 << "%)\n";
        if (proof.greeks.critical_headroom_alert) {
            os << "  CRITICAL: headroom buffer breached "
               << proof.greeks.session_alert_count << " times this session\n";
        }

        const SlippageProof& s = proof.slippage_within_plan;
        os << "Slippage vs Plan:\n";
        os << std::setprecision(4);
        if (s.real_slippage_vs_nbbo) {
            os << "  Real: " << *s.real_slippage_vs_nbbo
               << " vs NBBO mid $" << std::setprecision(2) << *s.nbbo_mid_at_fill << "\n";
        } else {
            os << "  Reported: " << s.actual << " (fallback, no NBBO)\n";
        }
    }

    if (!proof.overall.passed) {
        os << "\nViolations:\n";
        for (const std::string& r : proof.overall.reasons) {
            os << "  - " << r << "\n";
        }
    }
    return os.str();
}

}

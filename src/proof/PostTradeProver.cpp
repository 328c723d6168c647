#include "sentinel/proof/PostTradeProver.hpp"

#include "sentinel/core/Errors.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sentinel::proof {

namespace {

std::string fixed(double v, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << v;
    return os.str();
}

bool finite(const Greeks& g) {
    return std::isfinite(g.delta) &&
           std::isfinite(g.gamma) &&
           std::isfinite(g.theta) &&
           std::isfinite(g.vega) &&
           std::isfinite(g.rho);
}

double driftPct(double actual, double reserved) {
    double denom = reserved != 0.0 ? std::fabs(reserved) : 1.0;
    return std::fabs(actual - reserved) / denom;
}

const char* UNPROVEN = "UNPROVEN_NO_PROMISE: no valid pre-trade promise";

}

std::string reasonCode(const std::string& reason) {
    size_t colon = reason.find(':');
    return colon == std::string::npos ? reason : reason.substr(0, colon);
}

std::string PreTradePromise::validate() const {
    if (option_type.empty()) return "option_type missing";
    if (!std::isfinite(sizing.notional) || sizing.notional <= 0.0) {
        return "sizing.notional must be positive";
    }
    if (!finite(sizing.greeks)) return "sizing.greeks not finite";
    if (!std::isfinite(greeks_limits.delta_max) || greeks_limits.delta_max <= 0.0 ||
        !std::isfinite(greeks_limits.theta_max) || greeks_limits.theta_max <= 0.0 ||
        !std::isfinite(greeks_limits.vega_max) || greeks_limits.vega_max <= 0.0) {
        return "greeksLimits must be positive";
    }
    if (!std::isfinite(execution_plan.max_slippage) || execution_plan.max_slippage < 0.0) {
        return "executionPlan.maxSlippage must be non-negative";
    }
    if (!std::isfinite(promised_net_debit)) return "promisedNetDebit not finite";
    return "";
}

PostTradeProver::PostTradeProver(
    const audit::AuditStore* store,
    HeadroomMonitor& headroom,
    ProverLimits limits,
    infra::WallClock clock
) : store(store),
    headroom(headroom),
    lim(std::move(limits)),
    clock(std::move(clock)) {}

Proof PostTradeProver::verifyExecution(
    const std::optional<PreTradePromise>& promise,
    const PostTradeFact& fact
) const {
    Proof proof;
    proof.trade_id = fact.id;
    proof.verified_at = clock();
    if (store) {
        proof.stamp = store->stamper().stamp(fact.timestamp, proof.verified_at);
    } else {
        proof.stamp.server_ts = proof.verified_at;
        proof.stamp.ts_feed = fact.timestamp;
        proof.stamp.ts_recv = proof.verified_at;
    }

    std::string defect;
    if (!promise) {
        proof.promise.fail("PROMISE_MISSING: no pre-trade promise for " + fact.id);
    } else {
        defect = promise->validate();
        if (!defect.empty()) {
            proof.promise.fail("PROMISE_MALFORMED: " + defect);
        }
    }

    if (proof.promise.passed) {
        const PreTradePromise& p = *promise;
        proof.execution = proveExecutionBounds(p, fact);
        proof.structure = proveStructureBounds(p, fact);
        proof.cash = proveCashBounds(p, fact);
        proof.greeks = proveGreeksDrift(p, fact);
        proof.slippage_within_plan = proveSlippageWithinPlan(p, fact);
        proof.greeks_caps_within = proveGreeksCapsWithin(p, fact);
    } else {
        proof.execution.fail(UNPROVEN);
        proof.structure.fail(UNPROVEN);
        proof.cash.fail(UNPROVEN);
        proof.greeks.fail(UNPROVEN);
        proof.slippage_within_plan.fail(UNPROVEN);
        proof.greeks_caps_within.fail(UNPROVEN);
    }
    proof.net_debit_only = proveNetDebitOnly(fact);
    proof.sides_ok = proveSidesOK(fact);

    const SubProof* parts[] = {
        &proof.promise,
        &proof.execution,
        &proof.structure,
        &proof.cash,
        &proof.greeks,
        &proof.net_debit_only,
        &proof.sides_ok,
        &proof.slippage_within_plan,
        &proof.greeks_caps_within
    };
    for (const SubProof* sp : parts) {
        if (!sp->passed) {
            proof.overall.passed = false;
            proof.overall.reasons.insert(
                proof.overall.reasons.end(),
                sp->reasons.begin(),
                sp->reasons.end()
            );
        }
    }

    if (!proof.overall.passed) {
        std::cout << "[PROVER] trade " << fact.id << " FAILED ("
                  << proof.overall.reasons.size() << " violations)" << std::endl;
    }
    return proof;
}

// --- execution ---

ExecutionProof PostTradeProver::proveExecutionBounds(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    ExecutionProof r;
    r.planned_slippage = p.execution_plan.max_slippage;
    r.actual_slippage = f.actual_slippage;
    r.fill_pct = f.fill_pct;

    double bound = r.planned_slippage * lim.max_slippage_multiplier;
    if (!(r.actual_slippage <= bound)) {
        r.fail("SLIPPAGE_EXCEEDED: " + fixed(r.actual_slippage, 3) +
               " > " + fixed(bound, 3));
    }
    if (!(r.fill_pct >= lim.min_fill_pct)) {
        r.fail("INSUFFICIENT_FILL: " + fixed(r.fill_pct * 100.0, 1) +
               "% < " + fixed(lim.min_fill_pct * 100.0, 1) + "%");
    }
    return r;
}

// --- structure ---

StructureProof PostTradeProver::proveStructureBounds(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    StructureProof r;
    r.promised_net_debit = p.promised_net_debit;
    r.actual_net_debit = f.net_debit;

    if (!(std::fabs(r.actual_net_debit - r.promised_net_debit) <= lim.net_debit_tolerance)) {
        r.fail("NET_DEBIT_MISMATCH: promised $" + fixed(r.promised_net_debit, 2) +
               ", actual $" + fixed(r.actual_net_debit, 2));
    }
    if (r.actual_net_debit < 0.0) {
        r.fail("CREDIT_EXECUTED: $" + fixed(r.actual_net_debit, 2) +
               " credit violates cash-only policy");
    }
    if (p.option_type != f.option_type) {
        r.fail("STRUCTURE_MISMATCH: promised " + p.option_type +
               ", executed " + (f.option_type.empty() ? "unknown" : f.option_type));
    }
    return r;
}

// --- cash ---

CashProof PostTradeProver::proveCashBounds(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    CashProof r;
    r.promised_cost = p.sizing.notional;
    r.actual_cost = f.total_cost;

    double tolerance = r.promised_cost * lim.cost_tolerance_pct;
    if (!(std::fabs(r.actual_cost - r.promised_cost) <= tolerance)) {
        r.fail("COST_MISMATCH: promised $" + fixed(r.promised_cost, 2) +
               ", actual $" + fixed(r.actual_cost, 2) +
               " (+/-$" + fixed(tolerance, 2) + ")");
    }
    if (!(f.cash_after >= 0.0)) {
        r.fail("NEGATIVE_CASH: post-trade cash $" + fixed(f.cash_after, 2) +
               " violates cash-only policy");
    }
    return r;
}

// --- greeks drift ---

GreeksDriftProof PostTradeProver::proveGreeksDrift(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    GreeksDriftProof r;
    const GreeksLimits& L = p.greeks_limits;
    const Greeks& reserved = p.sizing.greeks;
    const Greeks& actual = f.portfolio_greeks;

    r.reserved_headroom = {
        L.delta_max - std::fabs(reserved.delta),
        L.theta_max - std::fabs(reserved.theta),
        L.vega_max - std::fabs(reserved.vega)
    };
    r.actual_headroom = {
        L.delta_max - std::fabs(actual.delta),
        L.theta_max - std::fabs(actual.theta),
        L.vega_max - std::fabs(actual.vega)
    };
    r.headroom_deltas = {
        std::fabs(r.actual_headroom.delta - r.reserved_headroom.delta),
        std::fabs(r.actual_headroom.theta - r.reserved_headroom.theta),
        std::fabs(r.actual_headroom.vega - r.reserved_headroom.vega)
    };
    r.drift_percentages = {
        driftPct(r.actual_headroom.delta, r.reserved_headroom.delta),
        driftPct(r.actual_headroom.theta, r.reserved_headroom.theta),
        driftPct(r.actual_headroom.vega, r.reserved_headroom.vega)
    };

    struct Row {
        const char* name;
        const char* code;
        double reserved;
        double actual;
        double drift;
        int digits;
    };
    const Row rows[] = {
        {"delta", "DELTA", r.reserved_headroom.delta, r.actual_headroom.delta, r.drift_percentages.delta, 4},
        {"theta", "THETA", r.reserved_headroom.theta, r.actual_headroom.theta, r.drift_percentages.theta, 6},
        {"vega", "VEGA", r.reserved_headroom.vega, r.actual_headroom.vega, r.drift_percentages.vega, 4}
    };

    for (const Row& row : rows) {
        if (!(row.actual >= row.reserved * lim.headroom_buffer)) {
            r.fail(std::string(row.code) + "_HEADROOM_REDUCED: actual(" +
                   fixed(row.actual, row.digits) + ") < reserved(" +
                   fixed(row.reserved, row.digits) + ")");
            r.buffer_violations.push_back(row.name);
        }
    }

    if (!r.buffer_violations.empty()) {
        r.session_alert_count = headroom.recordWarning(f.id, r.buffer_violations);
        r.critical_headroom_alert = headroom.critical();
    }

    for (const Row& row : rows) {
        if (!(row.drift <= lim.greeks_drift_max)) {
            r.fail(std::string(row.code) + "_DRIFT_EXCEEDED: " +
                   fixed(row.drift * 100.0, 1) + "% > " +
                   fixed(lim.greeks_drift_max * 100.0, 1) + "%");
        }
    }
    return r;
}

// --- net debit ---

NetDebitProof PostTradeProver::proveNetDebitOnly(const PostTradeFact& f) const {
    NetDebitProof r;
    r.actual_net_debit = f.net_debit;
    if (!(f.net_debit >= 0.0)) {
        r.fail("CREDIT_EXECUTED: $" + fixed(f.net_debit, 2) +
               " violates cash-only policy");
    }
    return r;
}

// --- sides ---

SidesProof PostTradeProver::proveSidesOK(const PostTradeFact& f) const {
    SidesProof r;
    r.actual_sides = f.sides;

    std::string joined;
    bool forbidden = false;
    bool entry = false;
    for (const std::string& s : f.sides) {
        if (!joined.empty()) joined += ", ";
        joined += s;
        if (s == "SELL_TO_OPEN") forbidden = true;
        if (s == "BUY_TO_OPEN") entry = true;
    }
    if (joined.empty()) joined = "none";

    if (forbidden) {
        r.fail("FORBIDDEN_SIDE: " + joined + " contains shorting");
    }
    if (!entry) {
        r.fail("MISSING_ENTRY_SIDE: " + joined + " missing BUY_TO_OPEN");
    }
    return r;
}

// --- slippage vs recorded NBBO ---

double PostTradeProver::leveragedBonus(const std::string& symbol) const {
    for (const std::string& s : lim.leveraged_etf_symbols) {
        if (!s.empty() && symbol.find(s) != std::string::npos) {
            return lim.leveraged_etf_bonus;
        }
    }
    return 0.0;
}

SlippageProof PostTradeProver::proveSlippageWithinPlan(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    SlippageProof r;
    r.plan_id = f.planKey();
    r.planned_max = p.execution_plan.max_slippage;
    r.actual = f.actual_slippage;
    r.fill_price = f.price;
    r.leveraged_etf_bonus = leveragedBonus(f.symbol);
    r.effective_max = r.planned_max + r.leveraged_etf_bonus;

    std::optional<audit::NbboSnapshot> nbbo;
    try {
        if (store) {
            if (auto order = store->orderForPlan(r.plan_id)) {
                r.planned_max = order->planned_max_slip;
                r.persisted_plan = true;
                r.effective_max = r.planned_max + r.leveraged_etf_bonus;
            }
            nbbo = store->nbboAt(f.symbol, f.timestamp, lim.nbbo_tolerance_ms);
        }
    } catch (const StoreError& e) {
        r.calculation_error = e.what();
        std::cerr << "[PROVER] NBBO lookup failed for " << f.symbol
                  << ": " << e.what() << std::endl;
    }

    if (nbbo && nbbo->mid > 0.0) {
        double real = std::fabs(f.price - nbbo->mid) / nbbo->mid;
        double bound = r.effective_max * lim.max_slippage_multiplier;
        r.real_slippage_vs_nbbo = real;
        r.nbbo_mid_at_fill = nbbo->mid;
        r.within = real <= bound;
        if (!r.within) {
            r.fail("REAL_SLIPPAGE_EXCEEDED: " + fixed(real, 4) + " > " +
                   fixed(bound, 4) + " (vs NBBO mid $" + fixed(nbbo->mid, 2) + ")");
        }
        r.fill_outside_spread = f.price < nbbo->bid || f.price > nbbo->ask;
        if (r.fill_outside_spread) {
            r.fail("FILL_OUTSIDE_SPREAD: $" + fixed(f.price, 2) + " outside [$" +
                   fixed(nbbo->bid, 2) + ", $" + fixed(nbbo->ask, 2) + "]");
        }
        return r;
    }

    // Self-reported slippage only; weaker evidence.
    r.using_fallback = true;
    double bound = r.planned_max * lim.max_slippage_multiplier;
    r.within = r.actual <= bound;
    if (!r.within) {
        r.fail("SLIPPAGE_EXCEEDED: " + fixed(r.actual, 3) + " > " +
               fixed(bound, 3) + " (no NBBO data available)");
    }
    if (lim.require_nbbo) {
        r.fail("NBBO_UNAVAILABLE: no NBBO for " + f.symbol + " within " +
               std::to_string(lim.nbbo_tolerance_ms) + "ms of fill");
    }
    return r;
}

// --- post-trade caps ---

GreeksCapsProof PostTradeProver::proveGreeksCapsWithin(
    const PreTradePromise& p,
    const PostTradeFact& f
) const {
    GreeksCapsProof r;
    r.post_trade = f.portfolio_greeks;
    r.limits = p.greeks_limits;

    if (!(f.portfolio_greeks.theta <= r.limits.theta_max)) {
        r.fail("THETA_CAP_EXCEEDED: " + fixed(f.portfolio_greeks.theta, 4) +
               " > " + fixed(r.limits.theta_max, 4));
    }
    double abs_delta = std::fabs(f.portfolio_greeks.delta);
    if (!(abs_delta <= r.limits.delta_max)) {
        r.fail("DELTA_CAP_EXCEEDED: " + fixed(abs_delta, 3) +
               " > " + fixed(r.limits.delta_max, 3));
    }
    return r;
}

}

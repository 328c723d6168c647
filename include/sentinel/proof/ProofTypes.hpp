#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditRecords.hpp"
#include "sentinel/core/Greeks.hpp"
#include "sentinel/infra/Clock.hpp"

namespace sentinel::proof {

using infra::TimestampMs;

struct GreeksLimits {
    double delta_max = 0.10;
    double theta_max = 0.0025;
    double vega_max = 0.20;
};

// What the planner promised before the order went out.
struct PreTradePromise {
    struct Sizing {
        double notional = 0.0;
        Greeks greeks;          // reserved portfolio greeks
    };
    struct ExecutionPlan {
        double max_slippage = 0.06;
    };

    std::string option_type;
    Sizing sizing;
    GreeksLimits greeks_limits;
    ExecutionPlan execution_plan;
    double promised_net_debit = 0.0;

    // Empty when usable, otherwise the first defect found.
    std::string validate() const;
};

// What the broker actually did.
struct PostTradeFact {
    std::string id;
    std::string plan_id;        // falls back to id when empty
    std::string symbol;
    std::string option_type;
    std::string side;
    double price = 0.0;
    double qty = 0.0;
    double fees = 0.0;
    TimestampMs timestamp = 0;
    double net_debit = 0.0;
    double total_cost = 0.0;
    double cash_before = 0.0;
    double cash_after = 0.0;
    Greeks portfolio_greeks;
    std::vector<std::string> sides;
    std::string broker_attestation;
    double actual_slippage = 0.0;
    double fill_pct = 1.0;

    const std::string& planKey() const { return plan_id.empty() ? id : plan_id; }
};

// Reasons are "CODE: detail" strings.
struct SubProof {
    bool passed = true;
    std::vector<std::string> reasons;

    void fail(std::string reason) {
        passed = false;
        reasons.push_back(std::move(reason));
    }
};

std::string reasonCode(const std::string& reason);

struct ExecutionProof : SubProof {
    double planned_slippage = 0.0;
    double actual_slippage = 0.0;
    double fill_pct = 0.0;
};

struct StructureProof : SubProof {
    double promised_net_debit = 0.0;
    double actual_net_debit = 0.0;
};

struct CashProof : SubProof {
    double promised_cost = 0.0;
    double actual_cost = 0.0;
};

struct GreekTriple {
    double delta = 0.0;
    double theta = 0.0;
    double vega = 0.0;
};

struct GreeksDriftProof : SubProof {
    GreekTriple reserved_headroom;
    GreekTriple actual_headroom;
    GreekTriple headroom_deltas;
    GreekTriple drift_percentages;
    std::vector<std::string> buffer_violations;   // greek names
    bool critical_headroom_alert = false;
    size_t session_alert_count = 0;
};

struct NetDebitProof : SubProof {
    double actual_net_debit = 0.0;
};

struct SidesProof : SubProof {
    std::vector<std::string> actual_sides;
};

struct SlippageProof : SubProof {
    std::string plan_id;
    double planned_max = 0.0;
    bool persisted_plan = false;
    double actual = 0.0;
    double leveraged_etf_bonus = 0.0;
    double effective_max = 0.0;
    std::optional<double> real_slippage_vs_nbbo;
    std::optional<double> nbbo_mid_at_fill;
    double fill_price = 0.0;
    bool within = true;
    bool fill_outside_spread = false;
    bool using_fallback = false;
    std::string calculation_error;
};

struct GreeksCapsProof : SubProof {
    Greeks post_trade;
    GreeksLimits limits;
};

struct OverallResult {
    bool passed = true;
    std::vector<std::string> reasons;
};

struct Proof {
    std::string trade_id;
    TimestampMs verified_at = 0;
    audit::AuditStamp stamp;

    SubProof promise;
    ExecutionProof execution;
    StructureProof structure;
    CashProof cash;
    GreeksDriftProof greeks;
    NetDebitProof net_debit_only;
    SidesProof sides_ok;
    SlippageProof slippage_within_plan;
    GreeksCapsProof greeks_caps_within;

    OverallResult overall;
};

}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/infra/Clock.hpp"
#include "sentinel/infra/Json.hpp"

namespace sentinel::capital {

using infra::TimestampMs;
namespace json = boost::json;

enum class AllocationStatus {
    STAGED,
    ACTIVE,
    EXPIRED,
    FROZEN
};

const char* toString(AllocationStatus s);
std::optional<AllocationStatus> parseStatus(const std::string& s);

// EXPIRED and FROZEN never change again.
inline bool isTerminal(AllocationStatus s) {
    return s == AllocationStatus::EXPIRED || s == AllocationStatus::FROZEN;
}

struct Allocation {
    std::string id;
    std::string session_id;
    std::string strategy_ref;
    std::string pool = "evo";
    double allocation = 0.0;        // fraction of equity, (0,1]
    AllocationStatus status = AllocationStatus::STAGED;
    TimestampMs ttl_until = 0;
    std::string consistency_token;
    TimestampMs created_at = 0;
    TimestampMs activated_at = 0;
    uint64_t seq = 0;
    std::string status_reason;
};

struct StrategyPerformance {
    double sharpe = 0.0;
    double max_drawdown = 1.0;
    double win_rate = 0.0;
    int64_t trade_count = 0;
    double avg_slippage_bps = 1e9;
    double trace_completeness = 0.0;
};

struct PrecheckFailure {
    std::string check;
    double value = 0.0;
    double threshold = 0.0;
    std::string message;
};

struct PrecheckResult {
    bool pass = false;
    double score = 0.0;
    std::vector<PrecheckFailure> failures;

    std::string reason() const;
};

struct StageRequest {
    std::string session_id;
    std::string strategy_ref;
    double allocation = 0.0;
    std::string pool = "evo";
    double ttl_days = 7.0;
    std::string consistency_token;
    StrategyPerformance performance;
    std::string reference_symbol;   // empty: any recorded quote
};

enum class StageCode {
    STAGED,
    REPLAYED,
    INVALID_REQUEST,
    FROZEN,
    PRECHECK_FAILED,
    COMPLIANCE_FAILED,
    STALE_MARKET_DATA,
    STORE_ERROR
};

const char* toString(StageCode c);

struct StageResult {
    StageCode code = StageCode::INVALID_REQUEST;
    std::vector<std::string> reasons;
    std::optional<Allocation> allocation;
    PrecheckResult precheck;

    bool ok() const { return code == StageCode::STAGED || code == StageCode::REPLAYED; }
};

enum class RebalanceMode {
    PREVIEW,
    EXECUTE
};

enum class RebalanceStatus {
    APPLIED,
    PREVIEW,
    REPLAYED,
    LOCKED,
    FROZEN,
    FAILED
};

const char* toString(RebalanceStatus s);
std::optional<RebalanceStatus> parseRebalanceStatus(const std::string& s);

struct AllocationChange {
    std::string id;
    std::string strategy_ref;
    double allocation = 0.0;
    std::string reason;
};

struct RebalanceResult {
    RebalanceStatus status = RebalanceStatus::FAILED;
    std::string bucket;
    std::string consistency_token;
    TimestampMs at = 0;
    double pool_cap = 0.0;
    double total_before = 0.0;
    double total_after = 0.0;
    std::vector<AllocationChange> activated;
    std::vector<AllocationChange> rejected;
    std::vector<AllocationChange> expired;
    std::string message;
};

struct ProductionMetrics {
    double sharpe_20d = 1.0;
    double drawdown = 0.0;
};

struct LedgerEntry {
    Allocation allocation;
    size_t fills = 0;
    double open_qty = 0.0;
    double avg_cost = 0.0;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;
    bool marked = false;
};

struct LedgerView {
    std::vector<LedgerEntry> entries;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;
    bool degraded = false;
    TimestampMs as_of = 0;
};

struct PoolStatus {
    double cap_pct = 0.0;
    double utilization_pct = 0.0;
    double available_capacity = 0.0;
    double equity = 0.0;
    size_t active_count = 0;
    std::string risk_level = "low";
    bool frozen = false;
    bool degraded = false;
    TimestampMs as_of = 0;
};

json::object toJson(const Allocation& a);
Allocation allocationFromJson(const json::object& o);

json::object toJson(const RebalanceResult& r);
RebalanceResult rebalanceResultFromJson(const json::object& o);

}

#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/capital/AllocationBook.hpp"
#include "sentinel/capital/AllocationTypes.hpp"
#include "sentinel/capital/PromotionPrecheck.hpp"

namespace sentinel::capital {

struct AllocatorOptions {
    std::string state_file = "allocations.json";
    int64_t nbbo_max_age_ms = 300 * 1000;
    int64_t lock_stale_ms = 5 * 60 * 1000;
    double cap_tolerance = 1e-9;
    double default_equity = 100000.0;
};

// Extra gate before staging. Returns a failure reason, or nullopt.
using ComplianceCheck = std::function<std::optional<std::string>(const StageRequest&)>;
using MetricsSource = std::function<ProductionMetrics()>;
using CapObserver = std::function<void(TimestampMs, double used, double cap)>;

// ============================================================
// CapitalAllocator
//
// Sole writer of allocation state. stage() creates staged
// allocations behind the promotion precheck; rebalance() moves
// them into the pool under the current cap once per hour bucket.
// Consistency tokens make both calls safe to repeat.
// ============================================================
class CapitalAllocator {
public:
    CapitalAllocator(
        const audit::AuditStore* store,
        AllocatorOptions opts = AllocatorOptions(),
        PromotionThresholds promotion = PromotionThresholds(),
        PoolCapParams cap_params = PoolCapParams(),
        infra::WallClock clock = infra::systemClock()
    );

    StageResult stage(const StageRequest& req);

    RebalanceResult rebalance(
        RebalanceMode mode,
        const std::string& consistency_token = ""
    );

    PrecheckResult precheck(const StrategyPerformance& perf) const;

    LedgerView ledger() const;
    PoolStatus poolStatus() const;

    // Kill switch: every active allocation becomes frozen and staging
    // stops until resumeStaging().
    size_t freezeAll(const std::string& reason);
    void resumeStaging();
    bool frozen() const;

    void setComplianceCheck(ComplianceCheck check);
    void setMetricsSource(MetricsSource source);
    void setCapObserver(CapObserver observer);

    std::vector<Allocation> allocations() const;
    std::optional<Allocation> find(const std::string& id) const;
    double currentPoolCap() const;

private:
    RebalanceResult computeRebalance(
        AllocationState& state,
        TimestampMs now,
        double cap
    ) const;

    double equity() const;
    ProductionMetrics readMetrics(bool* degraded) const;

    const audit::AuditStore* store;
    AllocatorOptions opts;
    PromotionThresholds promotion;
    PoolCapParams cap_params;
    infra::WallClock clock;
    AllocationBook book;

    mutable std::mutex mtx;
    AllocationState state;
    ComplianceCheck compliance;
    MetricsSource metrics;
    CapObserver cap_observer;
};

}

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "TestSupport.hpp"
#include "sentinel/capital/CapitalAllocator.hpp"

using namespace sentinel;
using namespace sentinel::capital;
using namespace sentinel::test;

namespace {

StrategyPerformance promotable() {
    StrategyPerformance p;
    p.sharpe = 1.5;
    p.max_drawdown = 0.05;
    p.win_rate = 0.60;
    p.trade_count = 30;
    p.avg_slippage_bps = 5.0;
    p.trace_completeness = 0.99;
    return p;
}

StageRequest request(
    const std::string& strategy,
    double allocation,
    const std::string& token = ""
) {
    StageRequest r;
    r.session_id = "sess-1";
    r.strategy_ref = strategy;
    r.allocation = allocation;
    r.consistency_token = token;
    r.performance = promotable();
    return r;
}

class AllocatorTest : public ::testing::Test {
protected:
    AllocatorTest()
        : store(memoryStore(clock)) {
        freshQuote();
    }

    std::unique_ptr<CapitalAllocator> make(const std::string& state_file = "") {
        AllocatorOptions opts;
        opts.state_file = state_file;
        return std::make_unique<CapitalAllocator>(
            store.get(), opts, PromotionThresholds(), PoolCapParams(), clock.fn()
        );
    }

    void freshQuote(const std::string& symbol = "SPY") {
        store->recordQuote(quote(symbol, 99.9, 100.1, clock.get()));
    }

    // Next hour bucket with a fresh quote.
    void nextHour() {
        clock.advance(infra::MS_PER_HOUR);
        freshQuote();
    }

    std::string stageOk(CapitalAllocator& alloc, const StageRequest& req) {
        StageResult r = alloc.stage(req);
        EXPECT_EQ(r.code, StageCode::STAGED) << toString(r.code);
        return r.allocation ? r.allocation->id : std::string();
    }

    ManualClock clock;
    std::unique_ptr<audit::AuditStore> store;
};

}

TEST_F(AllocatorTest, PoolCapScenario) {
    auto alloc = make();
    EXPECT_DOUBLE_EQ(alloc->currentPoolCap(), 0.05);

    stageOk(*alloc, request("s1", 0.02));
    RebalanceResult first = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(first.status, RebalanceStatus::APPLIED);
    EXPECT_NEAR(first.total_after, 0.02, 1e-12);

    nextHour();
    std::string id2 = stageOk(*alloc, request("s2", 0.03));
    RebalanceResult second = alloc->rebalance(RebalanceMode::EXECUTE);
    ASSERT_EQ(second.activated.size(), 1u);
    EXPECT_EQ(second.activated[0].id, id2);
    EXPECT_NEAR(second.total_after, 0.05, 1e-9);

    nextHour();
    std::string id3 = stageOk(*alloc, request("s3", 0.01));
    RebalanceResult third = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_TRUE(third.activated.empty());
    ASSERT_EQ(third.rejected.size(), 1u);
    EXPECT_EQ(third.rejected[0].id, id3);
    EXPECT_NE(third.rejected[0].reason.find("would exceed pool cap"), std::string::npos);
    EXPECT_NEAR(third.total_after, 0.05, 1e-9);

    auto a3 = alloc->find(id3);
    ASSERT_TRUE(a3.has_value());
    EXPECT_EQ(a3->status, AllocationStatus::EXPIRED);
}

TEST_F(AllocatorTest, ActiveTotalNeverExceedsCap) {
    auto alloc = make();
    for (int i = 0; i < 10; ++i) {
        stageOk(*alloc, request("s" + std::to_string(i), 0.007 * (i + 1)));
    }
    RebalanceResult r = alloc->rebalance(RebalanceMode::EXECUTE);

    double total = 0.0;
    for (const Allocation& a : alloc->allocations()) {
        if (a.status == AllocationStatus::ACTIVE) total += a.allocation;
    }
    EXPECT_LE(total, r.pool_cap + 1e-9);
    EXPECT_NEAR(total, r.total_after, 1e-12);
    EXPECT_EQ(r.activated.size() + r.rejected.size(), 10u);
}

TEST_F(AllocatorTest, StagedAllocationsActivateInFifoOrder) {
    auto alloc = make();
    std::string a = stageOk(*alloc, request("first", 0.03));
    clock.advance(10);
    std::string b = stageOk(*alloc, request("second", 0.03));
    clock.advance(10);
    std::string c = stageOk(*alloc, request("third", 0.02));

    RebalanceResult r = alloc->rebalance(RebalanceMode::EXECUTE);
    ASSERT_EQ(r.activated.size(), 2u);
    EXPECT_EQ(r.activated[0].id, a);
    EXPECT_EQ(r.activated[1].id, c);
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0].id, b);
}

TEST_F(AllocatorTest, StageTokenReplays) {
    auto alloc = make();
    StageResult a = alloc->stage(request("s1", 0.02, "tok-1"));
    StageResult b = alloc->stage(request("s1", 0.02, "tok-1"));

    ASSERT_EQ(a.code, StageCode::STAGED);
    ASSERT_EQ(b.code, StageCode::REPLAYED);
    EXPECT_TRUE(b.ok());
    EXPECT_EQ(a.allocation->id, b.allocation->id);
    EXPECT_EQ(alloc->allocations().size(), 1u);

    // same token for another strategy is a new request
    StageResult c = alloc->stage(request("s2", 0.02, "tok-1"));
    EXPECT_EQ(c.code, StageCode::STAGED);
    EXPECT_EQ(alloc->allocations().size(), 2u);
}

TEST_F(AllocatorTest, RebalanceReplaysByBucketAndToken) {
    auto alloc = make();
    stageOk(*alloc, request("s1", 0.02));

    RebalanceResult a = alloc->rebalance(RebalanceMode::EXECUTE, "r-1");
    stageOk(*alloc, request("s2", 0.02));
    RebalanceResult b = alloc->rebalance(RebalanceMode::EXECUTE);

    EXPECT_EQ(a.status, RebalanceStatus::APPLIED);
    EXPECT_EQ(b.status, RebalanceStatus::REPLAYED);
    EXPECT_EQ(b.bucket, a.bucket);
    EXPECT_EQ(b.activated.size(), a.activated.size());

    nextHour();
    RebalanceResult c = alloc->rebalance(RebalanceMode::EXECUTE, "r-1");
    EXPECT_EQ(c.status, RebalanceStatus::REPLAYED);
    EXPECT_EQ(c.bucket, a.bucket);

    // s2 stays staged until a fresh bucket without a used token
    int staged = 0;
    for (const Allocation& x : alloc->allocations()) {
        if (x.status == AllocationStatus::STAGED) ++staged;
    }
    EXPECT_EQ(staged, 1);

    RebalanceResult d = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(d.status, RebalanceStatus::APPLIED);
    EXPECT_EQ(d.activated.size(), 1u);
}

TEST_F(AllocatorTest, PreviewDoesNotMutate) {
    auto alloc = make();
    std::string id = stageOk(*alloc, request("s1", 0.02));

    RebalanceResult p = alloc->rebalance(RebalanceMode::PREVIEW);
    EXPECT_EQ(p.status, RebalanceStatus::PREVIEW);
    ASSERT_EQ(p.activated.size(), 1u);
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::STAGED);

    RebalanceResult e = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(e.status, RebalanceStatus::APPLIED);
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::ACTIVE);
}

TEST_F(AllocatorTest, TtlExpiry) {
    auto alloc = make();
    StageRequest shortLived = request("s1", 0.02);
    shortLived.ttl_days = 1.0 / 24.0;
    std::string active = stageOk(*alloc, shortLived);
    alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(alloc->find(active)->status, AllocationStatus::ACTIVE);

    StageRequest neverActivated = request("s2", 0.02);
    neverActivated.ttl_days = 0.5 / 24.0;
    std::string staged = stageOk(*alloc, neverActivated);

    clock.advance(2 * infra::MS_PER_HOUR);
    RebalanceResult r = alloc->rebalance(RebalanceMode::EXECUTE);
    ASSERT_EQ(r.expired.size(), 2u);
    EXPECT_EQ(alloc->find(active)->status, AllocationStatus::EXPIRED);
    EXPECT_EQ(alloc->find(active)->status_reason, "ttl expired");
    EXPECT_EQ(alloc->find(staged)->status_reason, "ttl expired before activation");
    EXPECT_NEAR(r.total_after, 0.0, 1e-12);
}

TEST_F(AllocatorTest, CapContractionExpiresNewestFirst) {
    auto alloc = make();
    ProductionMetrics m;
    alloc->setMetricsSource([&m]() { return m; });

    std::string older = stageOk(*alloc, request("s1", 0.02));
    alloc->rebalance(RebalanceMode::EXECUTE);
    nextHour();
    std::string newer = stageOk(*alloc, request("s2", 0.02));
    alloc->rebalance(RebalanceMode::EXECUTE);

    m.drawdown = 0.5;           // cap falls to the floor
    nextHour();
    RebalanceResult r = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_DOUBLE_EQ(r.pool_cap, 0.03);
    ASSERT_EQ(r.expired.size(), 1u);
    EXPECT_EQ(r.expired[0].id, newer);
    EXPECT_EQ(r.expired[0].reason, "pool cap contracted");
    EXPECT_EQ(alloc->find(older)->status, AllocationStatus::ACTIVE);
}

TEST_F(AllocatorTest, FreezeStopsStagingUntilResumed) {
    auto alloc = make();
    std::string id = stageOk(*alloc, request("s1", 0.02));
    alloc->rebalance(RebalanceMode::EXECUTE);

    EXPECT_EQ(alloc->freezeAll("manual kill switch"), 1u);
    EXPECT_TRUE(alloc->frozen());
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::FROZEN);

    StageResult blocked = alloc->stage(request("s2", 0.01));
    EXPECT_EQ(blocked.code, StageCode::FROZEN);
    ASSERT_FALSE(blocked.reasons.empty());
    EXPECT_NE(blocked.reasons[0].find("manual kill switch"), std::string::npos);

    nextHour();
    alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::FROZEN);

    alloc->resumeStaging();
    EXPECT_FALSE(alloc->frozen());
    stageOk(*alloc, request("s2", 0.01));
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::FROZEN);
}

TEST_F(AllocatorTest, FreezeHoldsStagedAllocations) {
    auto alloc = make();
    std::string id = stageOk(*alloc, request("s1", 0.02));
    EXPECT_EQ(alloc->freezeAll("kill"), 0u);

    nextHour();
    RebalanceResult frozen = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(frozen.status, RebalanceStatus::FROZEN);
    EXPECT_TRUE(frozen.activated.empty());
    EXPECT_NE(frozen.message.find("kill"), std::string::npos);
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::STAGED);
    EXPECT_EQ(alloc->rebalance(RebalanceMode::PREVIEW).status, RebalanceStatus::FROZEN);

    alloc->resumeStaging();
    RebalanceResult applied = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(applied.status, RebalanceStatus::APPLIED);
    ASSERT_EQ(applied.activated.size(), 1u);
    EXPECT_EQ(alloc->find(id)->status, AllocationStatus::ACTIVE);
}

TEST_F(AllocatorTest, PrecheckListsEveryFailure) {
    auto alloc = make();
    StageRequest req = request("weak", 0.02);
    req.performance = StrategyPerformance();

    StageResult r = alloc->stage(req);
    EXPECT_EQ(r.code, StageCode::PRECHECK_FAILED);
    EXPECT_FALSE(r.precheck.pass);
    ASSERT_EQ(r.precheck.failures.size(), 6u);
    EXPECT_EQ(r.reasons[0], "Sharpe must be >= 1.2");
    EXPECT_EQ(r.reasons[1], "MaxDD must be <= 12%");
    EXPECT_EQ(r.reasons[2], "Win rate must be >= 52%");
    EXPECT_EQ(r.reasons[3], "Must have >= 25 trades");
    EXPECT_EQ(r.reasons[4], "Avg slippage must be <= 10 bps");
    EXPECT_EQ(r.reasons[5], "Trace completeness must be >= 98%");
    EXPECT_TRUE(alloc->allocations().empty());

    PrecheckResult ok = alloc->precheck(promotable());
    EXPECT_TRUE(ok.pass);
    EXPECT_DOUBLE_EQ(ok.score, 1.5);
    EXPECT_TRUE(ok.reason().empty());
}

TEST_F(AllocatorTest, InvalidRequests) {
    auto alloc = make();
    EXPECT_EQ(alloc->stage(request("s", 1.5)).code, StageCode::INVALID_REQUEST);
    EXPECT_EQ(alloc->stage(request("s", 0.0)).code, StageCode::INVALID_REQUEST);
    EXPECT_EQ(alloc->stage(request("", 0.02)).code, StageCode::INVALID_REQUEST);

    StageRequest noTtl = request("s", 0.02);
    noTtl.ttl_days = 0.0;
    EXPECT_EQ(alloc->stage(noTtl).code, StageCode::INVALID_REQUEST);
}

TEST_F(AllocatorTest, StaleMarketDataBlocksStaging) {
    auto alloc = make();
    clock.advance(301 * 1000);
    StageResult r = alloc->stage(request("s1", 0.02));
    EXPECT_EQ(r.code, StageCode::STALE_MARKET_DATA);

    freshQuote("QQQ");
    StageRequest spy = request("s1", 0.02);
    spy.reference_symbol = "SPY";
    EXPECT_EQ(alloc->stage(spy).code, StageCode::STALE_MARKET_DATA);
    EXPECT_EQ(alloc->stage(request("s1", 0.02)).code, StageCode::STAGED);

    CapitalAllocator noStore(nullptr, AllocatorOptions{""}, PromotionThresholds(),
                             PoolCapParams(), clock.fn());
    EXPECT_EQ(noStore.stage(request("s1", 0.02)).code, StageCode::STALE_MARKET_DATA);
}

TEST_F(AllocatorTest, ComplianceCheckGatesStaging) {
    auto alloc = make();
    alloc->setComplianceCheck([](const StageRequest&) -> std::optional<std::string> {
        return std::string("temporal compliance failed: PROOF_PASS_RATE_INSUFFICIENT");
    });
    StageResult r = alloc->stage(request("s1", 0.02));
    EXPECT_EQ(r.code, StageCode::COMPLIANCE_FAILED);
    ASSERT_EQ(r.reasons.size(), 1u);
    EXPECT_NE(r.reasons[0].find("PROOF_PASS_RATE_INSUFFICIENT"), std::string::npos);

    alloc->setComplianceCheck([](const StageRequest&) -> std::optional<std::string> {
        throw std::runtime_error("summary unavailable");
    });
    EXPECT_EQ(alloc->stage(request("s1", 0.02)).code, StageCode::COMPLIANCE_FAILED);

    alloc->setComplianceCheck([](const StageRequest&) { return std::optional<std::string>(); });
    EXPECT_EQ(alloc->stage(request("s1", 0.02)).code, StageCode::STAGED);
}

TEST(PoolCap, ThermostatFormula) {
    PoolCapParams p;
    EXPECT_DOUBLE_EQ(computePoolCap(p, 1.0, 0.0), 0.05);
    EXPECT_DOUBLE_EQ(computePoolCap(p, 1.5, 0.0), 0.07);
    EXPECT_DOUBLE_EQ(computePoolCap(p, 1.0, 0.005), 0.04);
    EXPECT_DOUBLE_EQ(computePoolCap(p, 1.0, 0.5), 0.03);
    EXPECT_DOUBLE_EQ(computePoolCap(p, 1.5, std::nan("")), 0.05);

    p.base = 0.5;
    EXPECT_DOUBLE_EQ(computePoolCap(p, 2.0, 0.0), 0.10);
}

TEST_F(AllocatorTest, CapObserverSeesAppliedRebalance) {
    auto alloc = make();
    std::vector<std::pair<double, double>> seen;
    alloc->setCapObserver([&seen](TimestampMs, double used, double cap) {
        seen.emplace_back(used, cap);
    });

    stageOk(*alloc, request("s1", 0.02));
    alloc->rebalance(RebalanceMode::PREVIEW);
    EXPECT_TRUE(seen.empty());

    alloc->rebalance(RebalanceMode::EXECUTE);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_NEAR(seen[0].first, 0.02, 1e-12);
    EXPECT_DOUBLE_EQ(seen[0].second, 0.05);
}

TEST_F(AllocatorTest, LedgerAttributesFillsByPlanPrefix) {
    auto alloc = make();
    std::string id = stageOk(*alloc, request("s1", 0.02));
    alloc->rebalance(RebalanceMode::EXECUTE);

    TimestampMs t = clock.get();
    store->recordFill(fill(id + ":1-1", "SPY", "BUY", 5.0, 10.0, 1.0, t + 1));
    store->recordFill(fill(id + ":1-2", "SPY", "SELL", 6.0, 4.0, 1.0, t + 2));
    store->recordFill(fill(id + "9:1-3", "SPY", "BUY", 1.0, 100.0, 0.0, t + 3));
    store->recordQuote(quote("SPY", 5.5, 5.7, t + 4));

    LedgerView v = alloc->ledger();
    ASSERT_EQ(v.entries.size(), 1u);
    const LedgerEntry& e = v.entries[0];
    EXPECT_EQ(e.fills, 2u);
    EXPECT_DOUBLE_EQ(e.avg_cost, 5.0);
    EXPECT_DOUBLE_EQ(e.open_qty, 6.0);
    EXPECT_NEAR(e.realized_pnl, 24.0 - 4.0 * 5.0 - 2.0, 1e-9);
    EXPECT_TRUE(e.marked);
    EXPECT_NEAR(e.unrealized_pnl, 6.0 * (5.5 - 5.0), 1e-9);
    EXPECT_NEAR(v.realized_pnl, 2.0, 1e-9);
    EXPECT_FALSE(v.degraded);
}

TEST_F(AllocatorTest, PoolStatusDegradesWhenMetricsFail) {
    auto alloc = make();
    PoolStatus healthy = alloc->poolStatus();
    EXPECT_FALSE(healthy.degraded);
    EXPECT_EQ(healthy.risk_level, "low");
    EXPECT_DOUBLE_EQ(healthy.equity, 100000.0);

    alloc->setMetricsSource([]() -> ProductionMetrics {
        throw std::runtime_error("metrics feed down");
    });
    PoolStatus ps = alloc->poolStatus();
    EXPECT_TRUE(ps.degraded);
    EXPECT_DOUBLE_EQ(ps.cap_pct, 0.03);
    EXPECT_EQ(ps.risk_level, "high");
}

TEST_F(AllocatorTest, StatePersistsAcrossRestart) {
    TempDir dir;
    std::string file = dir.path("allocations.json");
    std::string id;
    {
        auto alloc = make(file);
        id = stageOk(*alloc, request("s1", 0.02, "tok"));
        alloc->rebalance(RebalanceMode::EXECUTE, "r-1");
        alloc->freezeAll("test freeze");
    }

    auto reopened = make(file);
    auto a = reopened->find(id);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->status, AllocationStatus::FROZEN);
    EXPECT_TRUE(reopened->frozen());
    EXPECT_EQ(reopened->rebalance(RebalanceMode::EXECUTE, "r-1").status,
              RebalanceStatus::REPLAYED);
    EXPECT_EQ(reopened->stage(request("s1", 0.02, "tok")).code, StageCode::REPLAYED);
}

TEST_F(AllocatorTest, BatchLockSkipsConcurrentRebalance) {
    TempDir dir;
    std::string file = dir.path("allocations.json");
    auto alloc = make(file);
    stageOk(*alloc, request("s1", 0.02));

    {
        std::ofstream lock(file + ".lock");
        lock << "{\"pid\":1,\"since\":" << clock.get() << "}\n";
    }
    RebalanceResult locked = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(locked.status, RebalanceStatus::LOCKED);
    EXPECT_NE(locked.message.find("lock held"), std::string::npos);

    // a lock older than the stale limit is taken over
    clock.advance(6 * 60 * 1000);
    freshQuote();
    RebalanceResult applied = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(applied.status, RebalanceStatus::APPLIED);
    EXPECT_FALSE(std::filesystem::exists(file + ".lock"));
}

TEST_F(AllocatorTest, RebalanceSeesOtherProcessState) {
    TempDir dir;
    std::string file = dir.path("allocations.json");
    auto first = make(file);
    auto second = make(file);

    std::string id = stageOk(*first, request("s1", 0.02));
    RebalanceResult applied = first->rebalance(RebalanceMode::EXECUTE);
    ASSERT_EQ(applied.status, RebalanceStatus::APPLIED);
    ASSERT_EQ(applied.activated.size(), 1u);

    RebalanceResult again = second->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(again.status, RebalanceStatus::REPLAYED);
    EXPECT_EQ(again.activated.size(), 1u);
    ASSERT_TRUE(second->find(id).has_value());
    EXPECT_EQ(second->find(id)->status, AllocationStatus::ACTIVE);

    auto reopened = make(file);
    ASSERT_TRUE(reopened->find(id).has_value());
    EXPECT_EQ(reopened->find(id)->status, AllocationStatus::ACTIVE);
}

TEST_F(AllocatorTest, UnstampedLockIsAgedByMtime) {
    TempDir dir;
    std::string file = dir.path("allocations.json");
    auto alloc = make(file);
    stageOk(*alloc, request("s1", 0.02));

    std::string lock_file = file + ".lock";
    { std::ofstream lock(lock_file); }

    RebalanceResult locked = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(locked.status, RebalanceStatus::LOCKED);
    EXPECT_TRUE(std::filesystem::exists(lock_file));

    std::filesystem::last_write_time(
        lock_file,
        std::filesystem::file_time_type::clock::now() - std::chrono::minutes(10)
    );
    RebalanceResult applied = alloc->rebalance(RebalanceMode::EXECUTE);
    EXPECT_EQ(applied.status, RebalanceStatus::APPLIED);
    EXPECT_FALSE(std::filesystem::exists(lock_file));
}

TEST_F(AllocatorTest, CorruptStateFileThrows) {
    TempDir dir;
    std::string file = dir.path("allocations.json");
    {
        std::ofstream out(file);
        out << "{not json";
    }
    EXPECT_THROW(make(file), StoreError);
}

#include <gtest/gtest.h>

#include <fstream>

#include "TestSupport.hpp"

using namespace sentinel;
using namespace sentinel::test;

namespace {

std::unique_ptr<audit::AuditStore> flakyStore(
    const ManualClock& clock,
    std::shared_ptr<FlakyJournal::Control> ctl
) {
    return std::make_unique<audit::AuditStore>(
        std::make_unique<FlakyJournal>(ctl),
        testStamper(clock)
    );
}

}

TEST(AuditStore, QuoteMidOnlyWhenBothSidesPresent) {
    ManualClock clock;
    auto store = memoryStore(clock);

    ASSERT_TRUE(store->recordQuote(quote("AAPL", 1.00, 1.20, T0)));
    ASSERT_TRUE(store->recordQuote(quote("MSFT", 0.0, 2.00, T0)));

    auto aapl = store->latestQuoteFor("AAPL");
    ASSERT_TRUE(aapl.has_value());
    EXPECT_NEAR(aapl->mid, 1.10, 1e-12);

    auto msft = store->latestQuoteFor("MSFT");
    ASSERT_TRUE(msft.has_value());
    EXPECT_EQ(msft->mid, 0.0);
}

TEST(AuditStore, LatestFreshQuoteHonoursMaxAge) {
    ManualClock clock;
    auto store = memoryStore(clock);
    store->recordQuote(quote("SPY", 500.0, 500.2, T0 - 20000));
    store->recordQuote(quote("SPY", 501.0, 501.2, T0 - 4000));

    auto fresh = store->latestFreshQuote("SPY", 5000, T0);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_DOUBLE_EQ(fresh->bid, 501.0);

    EXPECT_FALSE(store->latestFreshQuote("SPY", 1000, T0).has_value());
    EXPECT_FALSE(store->latestFreshQuote("QQQ", 5000, T0).has_value());

    auto any = store->latestQuote();
    ASSERT_TRUE(any.has_value());
    EXPECT_EQ(any->ts_recv, T0 - 4000);
}

TEST(AuditStore, NbboAtPicksNearestAndEarliestOnTie) {
    ManualClock clock;
    auto store = memoryStore(clock);
    store->recordQuote(quote("SPY", 1.00, 1.10, T0 + 100));
    store->recordQuote(quote("SPY", 2.00, 2.10, T0 - 100));
    store->recordQuote(quote("SPY", 0.0, 3.10, T0));        // one-sided, never a snapshot

    auto nbbo = store->nbboAt("SPY", T0, 1000);
    ASSERT_TRUE(nbbo.has_value());
    EXPECT_EQ(nbbo->ts_recv, T0 - 100);
    EXPECT_NEAR(nbbo->mid, 2.05, 1e-12);

    auto closer = store->nbboAt("SPY", T0 + 90, 1000);
    ASSERT_TRUE(closer.has_value());
    EXPECT_EQ(closer->ts_recv, T0 + 100);

    EXPECT_FALSE(store->nbboAt("SPY", T0 + 5000, 1000).has_value());
}

TEST(AuditStore, WindowQueriesAreHalfOpen) {
    ManualClock clock;
    auto store = memoryStore(clock);
    store->recordFill(fill("p1", "SPY", "BUY_TO_OPEN", 10.0, 1, 0.0, T0));
    store->recordFill(fill("p2", "SPY", "BUY_TO_OPEN", 10.0, 1, 0.0, T0 + 1000));

    EXPECT_EQ(store->fillsInWindow(T0, T0 + 1000).size(), 1u);
    EXPECT_EQ(store->fillsInWindow(T0, T0 + 1001).size(), 2u);
    EXPECT_EQ(store->fillsInWindow(T0 + 1, T0 + 1000).size(), 0u);

    store->recordQuote(quote("SPY", 1.0, 1.1, T0 + 500));
    EXPECT_EQ(store->quotesInWindow(T0, T0 + 500).size(), 0u);
    EXPECT_EQ(store->quotesInWindow(T0 + 500, T0 + 501).size(), 1u);
}

TEST(AuditStore, FillsForPlanAreOrderedByFillTime) {
    ManualClock clock;
    auto store = memoryStore(clock);
    store->recordFill(fill("alloc_1:a", "SPY", "SELL_TO_CLOSE", 11.0, 1, 0.0, T0 + 300));
    store->recordFill(fill("alloc_1:a", "SPY", "BUY_TO_OPEN", 10.0, 1, 0.0, T0 + 100));
    store->recordFill(fill("alloc_1:b", "SPY", "BUY_TO_OPEN", 10.0, 2, 0.0, T0 + 200));
    store->recordFill(fill("alloc_2:a", "SPY", "BUY_TO_OPEN", 10.0, 3, 0.0, T0 + 50));

    auto plan = store->fillsForPlan("alloc_1:a");
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0].side, "BUY_TO_OPEN");
    EXPECT_EQ(plan[1].side, "SELL_TO_CLOSE");

    auto prefixed = store->fillsWithPlanPrefix("alloc_1:");
    ASSERT_EQ(prefixed.size(), 3u);
    EXPECT_EQ(prefixed[0].ts_fill, T0 + 100);
    EXPECT_EQ(prefixed[2].ts_fill, T0 + 300);
}

TEST(AuditStore, OrderForPlanReturnsLatestRecord) {
    ManualClock clock;
    auto store = memoryStore(clock);

    audit::OrderRecord o;
    o.plan_id = "plan-7";
    o.route = "ladder";
    o.ladders = {1.00, 1.02};
    o.planned_max_slip = 0.04;
    o.ts_created = T0;
    store->recordOrder(o);
    o.planned_max_slip = 0.05;
    store->recordOrder(o);

    auto got = store->orderForPlan("plan-7");
    ASSERT_TRUE(got.has_value());
    EXPECT_DOUBLE_EQ(got->planned_max_slip, 0.05);
    EXPECT_EQ(got->route, "ladder");
    EXPECT_EQ(got->ladders.size(), 2u);
    EXPECT_FALSE(store->orderForPlan("nope").has_value());
}

TEST(AuditStore, FrictionStatsCountsUnpricedFillsAsNonCompliant) {
    ManualClock clock;
    auto store = memoryStore(clock);
    store->recordFill(fill("a", "SPY", "BUY_TO_OPEN", 1.00, 100, 10.0, T0));     // 0.10
    store->recordFill(fill("b", "SPY", "BUY_TO_OPEN", 1.00, 100, 22.0, T0));     // 0.22
    store->recordFill(fill("c", "SPY", "BUY_TO_OPEN", 1.00, 100, 30.0, T0));     // 0.30
    store->recordFill(fill("d", "SPY", "BUY_TO_OPEN", 0.00, 100, 1.0, T0));      // no notional

    audit::FrictionStats st = store->frictionStats(T0, T0 + 1);
    EXPECT_EQ(st.total_fills, 4u);
    EXPECT_EQ(st.friction_20_count, 1u);
    EXPECT_EQ(st.friction_25_count, 2u);
    EXPECT_NEAR(st.avg_friction, (0.10 + 0.22 + 0.30) / 3.0, 1e-12);
}

TEST(AuditStore, EveryRecordCarriesItsStamp) {
    ManualClock clock;
    auto store = memoryStore(clock);
    clock.set(T0 + 42);
    store->recordQuote(quote("SPY", 1.0, 1.1, T0 + 40));
    store->recordFill(fill("p", "SPY", "BUY_TO_OPEN", 1.05, 1, 0.0, T0 + 41));

    auto trail = store->auditTrail();
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[0].seq, 1u);
    EXPECT_EQ(trail[0].record_type, "quote");
    EXPECT_EQ(trail[0].stamp.server_ts, T0 + 42);
    EXPECT_EQ(trail[0].stamp.ts_recv, T0 + 40);
    EXPECT_EQ(trail[0].stamp.commit_hash, "c0ffee");
    EXPECT_EQ(trail[0].stamp.policy_hash, "policy-test");
    EXPECT_EQ(trail[0].stamp.environment, "test");
    EXPECT_TRUE(trail[0].stamp.worm_mode);
    EXPECT_EQ(trail[1].seq, 2u);
    EXPECT_EQ(trail[1].record_type, "fill");
    EXPECT_EQ(trail[1].hash.size(), 64u);
}

TEST(AuditStore, JournalFailureIsSwallowedAndNothingIsIndexed) {
    ManualClock clock;
    auto ctl = std::make_shared<FlakyJournal::Control>();
    auto store = flakyStore(clock, ctl);

    EXPECT_TRUE(store->recordQuote(quote("SPY", 1.0, 1.1, T0)));

    ctl->fail_appends = true;
    bool ok = true;
    EXPECT_NO_THROW(ok = store->recordFill(fill("p", "SPY", "BUY_TO_OPEN", 1.05, 1, 0.0, T0)));
    EXPECT_FALSE(ok);
    EXPECT_EQ(store->droppedWrites(), 1u);
    EXPECT_TRUE(store->fillsForPlan("p").empty());
    EXPECT_EQ(store->size(), 1u);

    // The chain continues from the last record that reached the journal.
    ctl->fail_appends = false;
    EXPECT_TRUE(store->recordFill(fill("p", "SPY", "BUY_TO_OPEN", 1.05, 1, 0.0, T0)));
    EXPECT_TRUE(store->verifyChain().intact);
    EXPECT_EQ(store->auditTrail().back().seq, 2u);
}

TEST(AuditStore, HashChainDetectsEditedLine) {
    ManualClock clock;
    auto ctl = std::make_shared<FlakyJournal::Control>();
    auto store = flakyStore(clock, ctl);
    store->recordQuote(quote("AAPL", 1.0, 1.1, T0));
    store->recordQuote(quote("AAPL", 1.2, 1.3, T0 + 1));
    store->recordQuote(quote("AAPL", 1.4, 1.5, T0 + 2));

    audit::IntegrityReport clean = store->verifyChain();
    EXPECT_TRUE(clean.intact);
    EXPECT_EQ(clean.records, 3u);
    EXPECT_EQ(clean.chain_breaks, 0u);

    std::string& line = ctl->lines[1];
    line.replace(line.find("AAPL"), 4, "MSFT");

    audit::IntegrityReport tampered = store->verifyChain();
    EXPECT_FALSE(tampered.intact);
    EXPECT_EQ(tampered.chain_breaks, 1u);
    EXPECT_NE(tampered.first_error.find("line 2"), std::string::npos);
}

TEST(AuditStore, VerifyJournalFlagsDeletedLineAndGarbage) {
    ManualClock clock;
    auto ctl = std::make_shared<FlakyJournal::Control>();
    auto store = flakyStore(clock, ctl);
    store->recordQuote(quote("AAPL", 1.0, 1.1, T0));
    store->recordQuote(quote("AAPL", 1.2, 1.3, T0 + 1));
    store->recordQuote(quote("AAPL", 1.4, 1.5, T0 + 2));

    std::vector<std::string> lines = ctl->lines;
    lines.erase(lines.begin() + 1);
    audit::IntegrityReport gap = audit::verifyJournal(lines);
    EXPECT_FALSE(gap.intact);
    EXPECT_EQ(gap.chain_breaks, 1u);

    lines = ctl->lines;
    lines.push_back("not a journal line");
    audit::IntegrityReport junk = audit::verifyJournal(lines);
    EXPECT_FALSE(junk.intact);
    EXPECT_EQ(junk.bad_lines, 1u);
    EXPECT_EQ(junk.records, 3u);
}

TEST(AuditStore, ReopenReplaysJournalAndContinuesChain) {
    ManualClock clock;
    TempDir dir;
    std::string path = dir.path("audit.jsonl");

    {
        audit::AuditStore store(std::make_unique<audit::FileAuditJournal>(path), testStamper(clock));
        store.recordQuote(quote("SPY", 500.0, 500.5, T0));
        store.recordFill(fill("alloc_1:1", "SPY", "BUY_TO_OPEN", 500.25, 2, 0.5, T0 + 10));

        audit::LedgerChangeRecord lc;
        lc.cash_before = 1000.0;
        lc.cash_after = 0.0;
        lc.reason = "BUY_TO_OPEN SPY";
        lc.plan_id = "alloc_1:1";
        lc.ts_change = T0 + 10;
        store.recordLedgerChange(lc);
    }

    audit::AuditStore reopened(std::make_unique<audit::FileAuditJournal>(path), testStamper(clock));
    EXPECT_TRUE(reopened.integrity().intact);
    EXPECT_EQ(reopened.size(), 3u);

    auto fills = reopened.fillsForPlan("alloc_1:1");
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_DOUBLE_EQ(fills[0].price, 500.25);

    auto last = reopened.latestLedgerChange();
    ASSERT_TRUE(last.has_value());
    EXPECT_DOUBLE_EQ(last->cash_after, 0.0);

    reopened.recordQuote(quote("SPY", 501.0, 501.5, T0 + 20));
    EXPECT_EQ(reopened.auditTrail().back().seq, 4u);
    EXPECT_TRUE(reopened.verifyChain().intact);
}

TEST(AuditStore, ReopenOverTamperedFileKeepsServing) {
    ManualClock clock;
    TempDir dir;
    std::string path = dir.path("audit.jsonl");

    {
        audit::AuditStore store(std::make_unique<audit::FileAuditJournal>(path), testStamper(clock));
        store.recordQuote(quote("SPY", 500.0, 500.5, T0));
        store.recordQuote(quote("SPY", 501.0, 501.5, T0 + 1));
    }

    std::vector<std::string> lines;
    {
        std::ifstream in(path);
        std::string l;
        while (std::getline(in, l)) lines.push_back(l);
    }
    ASSERT_EQ(lines.size(), 2u);
    lines[0].replace(lines[0].find("SPY"), 3, "QQQ");
    {
        std::ofstream out(path, std::ios::trunc);
        for (const std::string& l : lines) out << l << '\n';
    }

    audit::AuditStore reopened(std::make_unique<audit::FileAuditJournal>(path), testStamper(clock));
    EXPECT_FALSE(reopened.integrity().intact);
    EXPECT_EQ(reopened.integrity().chain_breaks, 1u);
    EXPECT_TRUE(reopened.latestQuoteFor("SPY").has_value());
    EXPECT_TRUE(reopened.recordQuote(quote("SPY", 502.0, 502.5, T0 + 2)));
}

TEST(AuditStore, ChainLegsFilterBySymbolAndExpiry) {
    ManualClock clock;
    auto store = memoryStore(clock);

    audit::ChainLegRecord leg;
    leg.symbol = "SPY";
    leg.expiry = "2025-01-17";
    leg.strike = 500.0;
    leg.bid = 2.0;
    leg.ask = 2.1;
    leg.oi = 1500;
    leg.greeks.delta = 0.45;
    leg.ts_recv = T0;
    audit::ChainLegRecord later = leg;
    later.expiry = "2025-01-24";

    EXPECT_TRUE(store->recordChain({leg, later}));
    EXPECT_EQ(store->chainLegs("SPY", "2025-01-17").size(), 1u);
    EXPECT_EQ(store->chainLegs("SPY", "").size(), 2u);
    auto legs = store->chainLegs("SPY", "2025-01-24");
    ASSERT_EQ(legs.size(), 1u);
    EXPECT_DOUBLE_EQ(legs[0].greeks.delta, 0.45);
    EXPECT_EQ(legs[0].oi, 1500);
}

#include <gtest/gtest.h>

#include <stdexcept>

#include "TestSupport.hpp"
#include "sentinel/temporal/TemporalSummarizer.hpp"

using namespace sentinel;
using namespace sentinel::temporal;
using namespace sentinel::test;

namespace {

ProofOutcome outcome(
    TimestampMs ts,
    bool passed,
    const std::string& route = "paper_mid",
    bool slippage_within = true,
    bool promise_ok = true
) {
    ProofOutcome o;
    o.trade_id = "t" + std::to_string(ts);
    o.symbol = "SPY";
    o.route = route;
    o.ts = ts;
    o.passed = passed;
    o.promise_ok = promise_ok;
    o.slippage_within = slippage_within;
    return o;
}

class TemporalTest : public ::testing::Test {
protected:
    TemporalTest()
        : store(memoryStore(clock)),
          summarizer(*store, ledger, ComplianceThresholds(), clock.fn()) {}

    ManualClock clock;
    std::unique_ptr<audit::AuditStore> store;
    ProofLedger ledger;
    TemporalSummarizer summarizer;
};

}

TEST_F(TemporalTest, EmptyWindowPasses) {
    TemporalSummary s = summarizer.summarize(T0 - infra::MS_PER_HOUR, T0);
    EXPECT_TRUE(s.passed) << formatTemporalSummary(s);
    EXPECT_EQ(s.nbbo.samples, 0u);
    EXPECT_DOUBLE_EQ(s.nbbo.ratio, 1.0);
    EXPECT_DOUBLE_EQ(s.proofs.ratio, 1.0);
    EXPECT_EQ(s.generated_at, T0);
}

TEST_F(TemporalTest, NbboFreshnessCountsFillsWithNearbyQuote) {
    for (int i = 0; i < 10; ++i) {
        TimestampMs ts = T0 + i * 60000;
        if (i != 3) {
            store->recordQuote(quote("SPY", 99.9, 100.1, ts - 1000));
        }
        store->recordFill(fill("p" + std::to_string(i), "SPY", "BUY", 100.0, 1.0, 0.0, ts));
    }

    TemporalSummary s = summarizer.summarize(T0, T0 + infra::MS_PER_HOUR);
    EXPECT_EQ(s.nbbo.samples, 10u);
    EXPECT_EQ(s.nbbo.fresh, 9u);
    EXPECT_NEAR(s.nbbo.ratio, 0.9, 1e-12);
    EXPECT_FALSE(s.nbbo.passed);
    EXPECT_FALSE(s.passed);
    ASSERT_FALSE(s.reasons.empty());
    EXPECT_EQ(s.reasons[0].rfind("NBBO_FRESHNESS_INSUFFICIENT", 0), 0u);
}

TEST_F(TemporalTest, FrictionThresholds) {
    store->recordQuote(quote("SPY", 9.9, 10.1, T0));
    // fees / notional: 0.01, 0.22, 0.30
    store->recordFill(fill("a", "SPY", "BUY", 10.0, 10.0, 1.0, T0 + 1));
    store->recordFill(fill("b", "SPY", "BUY", 10.0, 10.0, 22.0, T0 + 2));
    store->recordFill(fill("c", "SPY", "BUY", 10.0, 10.0, 30.0, T0 + 3));

    TemporalSummary s = summarizer.summarize(T0, T0 + 1000);
    EXPECT_EQ(s.friction.samples, 3u);
    EXPECT_EQ(s.friction.friction_20_count, 1u);
    EXPECT_EQ(s.friction.friction_25_count, 2u);
    EXPECT_NEAR(s.friction.avg_friction, (0.01 + 0.22 + 0.30) / 3.0, 1e-12);
    EXPECT_FALSE(s.friction.passed);
    ASSERT_EQ(s.friction.reasons.size(), 2u);
    EXPECT_EQ(s.friction.reasons[0].rfind("FRICTION_20PCT_INSUFFICIENT", 0), 0u);
    EXPECT_EQ(s.friction.reasons[1].rfind("FRICTION_25PCT_INSUFFICIENT", 0), 0u);
}

TEST_F(TemporalTest, WindowIsHalfOpen) {
    ledger.append(outcome(T0 - 1, false));
    ledger.append(outcome(T0, true));
    ledger.append(outcome(T0 + 999, true));
    ledger.append(outcome(T0 + 1000, false));

    TemporalSummary s = summarizer.summarize(T0, T0 + 1000);
    EXPECT_EQ(s.proofs.samples, 2u);
    EXPECT_EQ(s.proofs.passed_count, 2u);
    EXPECT_TRUE(s.proofs.passed);
}

TEST_F(TemporalTest, ProofPassRateByRoute) {
    for (int i = 0; i < 8; ++i) ledger.append(outcome(T0 + i, true, "paper_mid"));
    ledger.append(outcome(T0 + 8, false, "ladder"));
    ledger.append(outcome(T0 + 9, true, ""));

    TemporalSummary s = summarizer.summarize(T0, T0 + 100);
    EXPECT_EQ(s.proofs.samples, 10u);
    EXPECT_NEAR(s.proofs.ratio, 0.9, 1e-12);
    EXPECT_FALSE(s.proofs.passed);

    ASSERT_EQ(s.proofs.by_route.size(), 3u);
    EXPECT_EQ(s.proofs.by_route["paper_mid"].total, 8u);
    EXPECT_DOUBLE_EQ(s.proofs.by_route["paper_mid"].pass_rate, 1.0);
    EXPECT_DOUBLE_EQ(s.proofs.by_route["ladder"].pass_rate, 0.0);
    EXPECT_EQ(s.proofs.by_route["UNROUTED"].passed, 1u);
}

TEST_F(TemporalTest, SlippageIgnoresProofsWithoutPromise) {
    ledger.append(outcome(T0, true, "r", true));
    ledger.append(outcome(T0 + 1, false, "r", false, false));

    ProofOutcome fb = outcome(T0 + 2, true, "r", true);
    fb.using_fallback = true;
    ledger.append(fb);

    TemporalSummary s = summarizer.summarize(T0, T0 + 100);
    EXPECT_EQ(s.slippage.samples, 2u);
    EXPECT_EQ(s.slippage.conforming, 2u);
    EXPECT_EQ(s.slippage.using_fallback, 1u);
    EXPECT_TRUE(s.slippage.passed);
}

TEST_F(TemporalTest, CapViolationsFail) {
    ledger.appendCap({T0, 0.04, 0.05});
    ledger.appendCap({T0 + 1, 0.05, 0.05});
    TemporalSummary ok = summarizer.summarize(T0, T0 + 100);
    EXPECT_TRUE(ok.caps.passed);
    EXPECT_EQ(ok.caps.samples, 2u);

    ledger.appendCap({T0 + 2, 0.06, 0.05});
    TemporalSummary bad = summarizer.summarize(T0, T0 + 100);
    EXPECT_EQ(bad.caps.violations, 1u);
    EXPECT_FALSE(bad.caps.passed);
    EXPECT_FALSE(bad.passed);
}

TEST_F(TemporalTest, SameInputsSameSummary) {
    store->recordQuote(quote("SPY", 99.0, 101.0, T0));
    store->recordFill(fill("p", "SPY", "BUY", 100.0, 2.0, 0.5, T0 + 10));
    ledger.append(outcome(T0 + 10, true));
    ledger.append(outcome(T0 + 20, false, "ladder", false));

    TemporalSummary a = summarizer.summarize(T0, T0 + 1000);
    clock.advance(5000);
    TemporalSummary b = summarizer.summarize(T0, T0 + 1000);

    EXPECT_EQ(a.passed, b.passed);
    EXPECT_EQ(a.reasons, b.reasons);
    EXPECT_DOUBLE_EQ(a.nbbo.ratio, b.nbbo.ratio);
    EXPECT_DOUBLE_EQ(a.friction.avg_friction, b.friction.avg_friction);
    EXPECT_DOUBLE_EQ(a.proofs.ratio, b.proofs.ratio);
    EXPECT_DOUBLE_EQ(a.slippage.ratio, b.slippage.ratio);
}

TEST_F(TemporalTest, TrailingPresets) {
    ledger.append(outcome(T0 - 2 * infra::MS_PER_HOUR, false));
    ledger.append(outcome(T0, true));

    TemporalSummary hour = summarizer.summarizeTrailing("1h");
    EXPECT_EQ(hour.window_end, T0 + 1);
    EXPECT_EQ(hour.proofs.samples, 1u);

    TemporalSummary day = summarizer.summarizeTrailing("24h");
    EXPECT_EQ(day.proofs.samples, 2u);

    EXPECT_THROW(summarizer.summarizeTrailing("2w"), std::invalid_argument);
    EXPECT_EQ(*windowPresetMs("7d"), 7 * infra::MS_PER_DAY);
    EXPECT_FALSE(windowPresetMs("").has_value());
}

TEST(ProofLedger, DropsEntriesPastRetention) {
    ProofLedger ledger(infra::MS_PER_DAY);
    ledger.append(outcome(T0, true));
    ledger.appendCap({T0, 0.01, 0.05});
    ledger.append(outcome(T0 + infra::MS_PER_HOUR, false));
    EXPECT_EQ(ledger.size(), 2u);

    ledger.append(outcome(T0 + infra::MS_PER_DAY + 1, true));
    EXPECT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger.capCount(), 0u);
    EXPECT_TRUE(ledger.outcomes(T0, T0 + 1).empty());

    ProofLedger week;
    week.append(outcome(T0, true));
    week.append(outcome(T0 + 6 * infra::MS_PER_DAY, true));
    EXPECT_EQ(week.size(), 2u);
    week.append(outcome(T0 + 8 * infra::MS_PER_DAY, true));
    EXPECT_EQ(week.size(), 2u);
}

TEST_F(TemporalTest, SummarizeProofCopiesOutcome) {
    proof::Proof p;
    p.trade_id = "t9";
    p.overall.passed = false;
    p.overall.reasons = {"CREDIT_EXECUTED: x"};
    p.slippage_within_plan.within = true;
    p.slippage_within_plan.using_fallback = true;

    proof::PostTradeFact f;
    f.id = "t9";
    f.symbol = "QQQ";
    f.timestamp = T0;

    ProofOutcome o = summarizeProof(p, f, "ladder");
    EXPECT_EQ(o.plan_id, "t9");
    EXPECT_EQ(o.route, "ladder");
    EXPECT_EQ(o.ts, T0);
    EXPECT_FALSE(o.passed);
    EXPECT_TRUE(o.promise_ok);
    EXPECT_TRUE(o.slippage_within);
    EXPECT_TRUE(o.using_fallback);
    EXPECT_EQ(o.reasons.size(), 1u);
}

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/capital/CapitalAllocator.hpp"
#include "sentinel/config/PipelineConfig.hpp"
#include "sentinel/coordination/DecisionCoordinator.hpp"
#include "sentinel/gate/PreTradeGate.hpp"
#include "sentinel/proof/HeadroomMonitor.hpp"
#include "sentinel/proof/PostTradeProver.hpp"
#include "sentinel/runtime/BrokerGateway.hpp"
#include "sentinel/runtime/HealthMonitor.hpp"
#include "sentinel/runtime/ReplayFeed.hpp"
#include "sentinel/runtime/StatsBook.hpp"
#include "sentinel/temporal/ProofLedger.hpp"
#include "sentinel/temporal/TemporalSummarizer.hpp"

namespace sentinel::runtime {

using infra::TimestampMs;

struct Position {
    std::string strategy_id;
    double qty = 0.0;
    double avg_cost = 0.0;
};

struct PortfolioSnapshot {
    double cash = 0.0;
    double exposure = 0.0;
    double nav = 0.0;
    std::map<std::string, Position> positions;
    Greeks greeks;
};

struct TradeOutcome {
    std::string plan_id;
    std::string symbol;
    std::string strategy_id;
    std::string side;           // BUY_TO_OPEN / SELL_TO_CLOSE
    double qty = 0.0;
    double price = 0.0;
    std::optional<proof::Proof> proof;   // entries only
};

struct CycleReport {
    TimestampMs at = 0;
    bool halted = false;
    size_t signals = 0;
    size_t winners = 0;
    size_t rejected = 0;
    size_t executed = 0;
    size_t broker_errors = 0;
    size_t proofs_failed = 0;
    std::vector<TradeOutcome> trades;
};

// ============================================================
// Pipeline
//
// Single owner of every component and of the paper portfolio.
// Nothing here is global; the daemon and the tests build one
// Pipeline and drive it through the same entry points.
//
//   signals -> coordinator -> gate -> broker -> audit -> prover
//
// Allocation staging and rebalancing run beside the cycle and
// share the same audit store.
// ============================================================
class Pipeline {
public:
    Pipeline(
        config::PipelineConfig cfg,
        std::unique_ptr<audit::IAuditJournal> journal,
        infra::WallClock clock = infra::systemClock()
    );

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Replaces the default PaperBroker.
    void setBroker(std::unique_ptr<IBrokerGateway> broker);

    // --- feed inputs ---
    void onQuote(audit::QuoteRecord q);
    void onChainLeg(audit::ChainLegRecord leg);
    void onSignal(const coordination::TradingSignal& s);
    void onStats(
        const std::string& strategy_id,
        const coordination::StrategyStats& stats
    );
    void onBrokerHeartbeat();
    void onPortfolioGreeks(const Greeks& g);
    void onProductionMetrics(const capital::ProductionMetrics& m);

    void apply(const FeedEvent& ev);

    // --- periodic work ---
    CycleReport runCycle();

    capital::RebalanceResult rebalance(
        capital::RebalanceMode mode = capital::RebalanceMode::EXECUTE,
        const std::string& consistency_token = ""
    );

    // Flags the feed stale when no quote arrived within staleness_ms.
    void checkStaleness();

    // --- operations ---
    capital::StageResult stage(const capital::StageRequest& req);

    // Routes one winning intent. Throws BrokerError when the broker
    // cannot confirm the fill; the order record stays but no fill or
    // ledger change is written.
    TradeOutcome execute(
        const coordination::WinningIntent& intent,
        double routed_qty
    );

    // Freezes every allocation and stops routing orders.
    size_t killSwitch(const std::string& reason);
    bool halted() const { return trading_halted.load(); }

    temporal::TemporalSummary complianceSummary(
        const std::string& preset = "24h"
    ) const;

    // --- accessors ---
    const config::PipelineConfig& config() const { return cfg; }
    audit::AuditStore& store() { return audit_store; }
    const audit::AuditStore& store() const { return audit_store; }
    coordination::DecisionCoordinator& coordinator() { return coord; }
    capital::CapitalAllocator& allocator() { return alloc; }
    const temporal::ProofLedger& proofLedger() const { return proofs; }
    const proof::HeadroomMonitor& headroom() const { return headroom_monitor; }
    const gate::GateRejectionLog& rejections() const { return rejection_log; }
    HealthMonitor& health() { return health_monitor; }
    IBrokerGateway& broker() { return *broker_gw; }

    PortfolioSnapshot portfolio() const;
    double drawdownMultiplier() const;

private:
    static audit::AuditStamper makeStamper(
        const config::PipelineConfig& cfg,
        infra::WallClock clock
    );
    static capital::AllocatorOptions allocatorOptions(
        const config::PipelineConfig& cfg
    );

    void wireAllocator();
    void restorePortfolio();

    gate::GateContext gateContext(
        const coordination::WinningIntent& intent,
        TimestampMs now
    ) const;

    std::string nextPlanId(const std::string& strategy_id);
    double expectedPrice(
        const std::string& symbol,
        double fallback,
        TimestampMs now
    ) const;

    config::PipelineConfig cfg;
    infra::WallClock clock;

    audit::AuditStore audit_store;
    coordination::DecisionCoordinator coord;
    proof::HeadroomMonitor headroom_monitor;
    proof::PostTradeProver prover;
    temporal::ProofLedger proofs;
    temporal::TemporalSummarizer summarizer;
    capital::CapitalAllocator alloc;
    HealthMonitor health_monitor;
    StatsBook stats_book;
    gate::GateRejectionLog rejection_log;
    std::unique_ptr<IBrokerGateway> broker_gw;

    std::atomic<bool> trading_halted{false};

    mutable std::mutex signal_mtx;
    std::vector<coordination::TradingSignal> pending;

    mutable std::mutex book_mtx;
    double cash = 0.0;
    std::map<std::string, Position> positions;
    Greeks greeks;
    capital::ProductionMetrics production;
    uint64_t plan_seq = 0;
};

}

#include "sentinel/runtime/Pipeline.hpp"

#include "sentinel/core/Errors.hpp"
#include "sentinel/runtime/PaperBroker.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

namespace sentinel::runtime {

namespace {

const char* BUY_TO_OPEN = "BUY_TO_OPEN";
const char* SELL_TO_CLOSE = "SELL_TO_CLOSE";

// Average-cost position update. Fees stay out of the cost basis.
void applyToPosition(
    std::map<std::string, Position>& positions,
    const std::string& symbol,
    const std::string& strategy_id,
    const std::string& side,
    double qty,
    double price
) {
    Position& p = positions[symbol];
    if (side == BUY_TO_OPEN) {
        double total = p.qty + qty;
        p.avg_cost = total > 0.0 ? (p.qty * p.avg_cost + qty * price) / total : 0.0;
        p.qty = total;
        if (!strategy_id.empty()) p.strategy_id = strategy_id;
    } else {
        p.qty = std::max(p.qty - qty, 0.0);
    }
    if (p.qty <= 0.0) {
        positions.erase(symbol);
    }
}

std::string joinReasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (const std::string& r : reasons) {
        if (!out.empty()) out += "; ";
        out += r;
    }
    return out;
}

}

// --- construction ---

audit::AuditStamper Pipeline::makeStamper(
    const config::PipelineConfig& cfg,
    infra::WallClock clock
) {
    return audit::AuditStamper(
        cfg.runtime.commit_hash,
        config::policyHash(cfg),
        cfg.runtime.environment,
        cfg.runtime.worm_mode,
        std::move(clock)
    );
}

capital::AllocatorOptions Pipeline::allocatorOptions(
    const config::PipelineConfig& cfg
) {
    capital::AllocatorOptions opts = cfg.allocator;
    opts.state_file = config::dataPath(cfg, cfg.allocator.state_file);
    return opts;
}

Pipeline::Pipeline(
    config::PipelineConfig pipeline_cfg,
    std::unique_ptr<audit::IAuditJournal> journal,
    infra::WallClock wall_clock
) : cfg(std::move(pipeline_cfg)),
    clock(std::move(wall_clock)),
    audit_store(std::move(journal), makeStamper(cfg, clock), cfg.audit),
    coord(cfg.coordinator, clock),
    headroom_monitor(2, clock),
    prover(&audit_store, headroom_monitor, cfg.prover, clock),
    summarizer(audit_store, proofs, cfg.compliance, clock),
    alloc(&audit_store, allocatorOptions(cfg), cfg.promotion, cfg.pool_cap, clock),
    broker_gw(std::make_unique<PaperBroker>(
        audit_store,
        cfg.execution.quote_max_age_ms,
        cfg.execution.fee_per_unit,
        clock
    )) {
    wireAllocator();
    restorePortfolio();

    if (alloc.frozen()) {
        trading_halted.store(true);
        std::cerr << "[PIPELINE] CRITICAL allocations frozen at start, routing halted" << std::endl;
    }

    std::cout << "[PIPELINE] env=" << cfg.runtime.environment
              << " policy=" << audit_store.stamper().policyHash().substr(0, 12)
              << " broker=" << broker_gw->name()
              << " cash=" << cash << std::endl;
}

void Pipeline::wireAllocator() {
    alloc.setComplianceCheck([this](const capital::StageRequest&) -> std::optional<std::string> {
        temporal::TemporalSummary s = summarizer.summarizeTrailing("24h");
        if (s.passed) return std::nullopt;
        return "temporal compliance failed: " + joinReasons(s.reasons);
    });

    alloc.setMetricsSource([this]() {
        std::lock_guard<std::mutex> lock(book_mtx);
        return production;
    });

    alloc.setCapObserver([this](TimestampMs ts, double used, double cap) {
        temporal::CapSnapshot snap;
        snap.ts = ts;
        snap.used = used;
        snap.cap = cap;
        proofs.appendCap(snap);
    });
}

void Pipeline::restorePortfolio() {
    std::lock_guard<std::mutex> lock(book_mtx);
    cash = cfg.execution.starting_cash;
    try {
        if (auto last = audit_store.latestLedgerChange()) {
            cash = last->cash_after;
        }
        for (const audit::FillRecord& f : audit_store.fillsInWindow(
                 0, std::numeric_limits<TimestampMs>::max())) {
            applyToPosition(positions, f.symbol, "", f.side, f.qty, f.price);
        }
    } catch (const StoreError& e) {
        std::cerr << "[PIPELINE] portfolio restore failed, starting flat: " << e.what() << std::endl;
        cash = cfg.execution.starting_cash;
        positions.clear();
    }
}

void Pipeline::setBroker(std::unique_ptr<IBrokerGateway> broker) {
    if (!broker) {
        throw std::invalid_argument("broker must not be null");
    }
    broker_gw = std::move(broker);
    std::cout << "[PIPELINE] broker=" << broker_gw->name() << std::endl;
}

// --- feed inputs ---

void Pipeline::onQuote(audit::QuoteRecord q) {
    if (q.ts_recv == 0) q.ts_recv = clock();
    if (q.ts_feed == 0) q.ts_feed = q.ts_recv;
    audit_store.recordQuote(q);
    health_monitor.onQuote(q.ts_recv);
}

void Pipeline::onChainLeg(audit::ChainLegRecord leg) {
    if (leg.ts_recv == 0) leg.ts_recv = clock();
    if (leg.ts_feed == 0) leg.ts_feed = leg.ts_recv;
    audit_store.recordChain({leg});
}

void Pipeline::onSignal(const coordination::TradingSignal& s) {
    std::lock_guard<std::mutex> lock(signal_mtx);
    pending.push_back(s);
}

void Pipeline::onStats(
    const std::string& strategy_id,
    const coordination::StrategyStats& s
) {
    stats_book.update(strategy_id, s);
}

void Pipeline::onBrokerHeartbeat() {
    if (broker_gw->heartbeat()) {
        health_monitor.onBrokerHeartbeat(clock());
    } else {
        std::cerr << "[HEALTH] broker " << broker_gw->name() << " missed heartbeat" << std::endl;
    }
}

void Pipeline::onPortfolioGreeks(const Greeks& g) {
    std::lock_guard<std::mutex> lock(book_mtx);
    greeks = g;
}

void Pipeline::onProductionMetrics(const capital::ProductionMetrics& m) {
    std::lock_guard<std::mutex> lock(book_mtx);
    production = m;
}

void Pipeline::apply(const FeedEvent& ev) {
    switch (ev.type) {
        case FeedEventType::QUOTE:
            onQuote(ev.quote);
            break;
        case FeedEventType::CHAIN:
            onChainLeg(ev.chain_leg);
            break;
        case FeedEventType::SIGNAL:
            onSignal(ev.signal);
            break;
        case FeedEventType::STATS:
            onStats(ev.strategy_id, ev.stats);
            break;
        case FeedEventType::STAGE:
            stage(ev.stage);
            break;
        case FeedEventType::HEARTBEAT:
            onBrokerHeartbeat();
            break;
        case FeedEventType::CYCLE:
            runCycle();
            break;
        case FeedEventType::REBALANCE:
            rebalance(
                ev.preview ? capital::RebalanceMode::PREVIEW : capital::RebalanceMode::EXECUTE,
                ev.consistency_token
            );
            break;
        case FeedEventType::PRODUCTION:
            onProductionMetrics(ev.production);
            break;
        case FeedEventType::GREEKS:
            onPortfolioGreeks(ev.greeks);
            break;
        case FeedEventType::KILL:
            killSwitch(ev.reason);
            break;
    }
}

// --- portfolio ---

PortfolioSnapshot Pipeline::portfolio() const {
    std::lock_guard<std::mutex> lock(book_mtx);
    PortfolioSnapshot s;
    s.cash = cash;
    s.positions = positions;
    s.greeks = greeks;
    for (const auto& [symbol, p] : positions) {
        s.exposure += p.qty * p.avg_cost;
    }
    s.nav = s.cash + s.exposure;
    return s;
}

// Size multiplier from production drawdown, on the same bands as the
// pool risk level: full size up to 5%, half up to 10%, nothing beyond.
double Pipeline::drawdownMultiplier() const {
    std::lock_guard<std::mutex> lock(book_mtx);
    double dd = production.drawdown;
    if (!std::isfinite(dd) || dd > 0.10) return 0.0;
    if (dd > 0.05) return 0.5;
    return 1.0;
}

double Pipeline::expectedPrice(
    const std::string& symbol,
    double fallback,
    TimestampMs now
) const {
    try {
        auto q = audit_store.latestFreshQuote(symbol, cfg.execution.quote_max_age_ms, now);
        if (q && q->mid > 0.0) return q->mid;
    } catch (const StoreError& e) {
        std::cerr << "[PIPELINE] quote lookup for " << symbol << ": " << e.what() << std::endl;
    }
    return fallback;
}

gate::GateContext Pipeline::gateContext(
    const coordination::WinningIntent& intent,
    TimestampMs now
) const {
    HealthSnapshot h = health_monitor.snapshot(now);
    PortfolioSnapshot p = portfolio();
    double price = expectedPrice(intent.symbol, intent.price, now);

    gate::GateContext ctx;
    ctx.nav = p.nav;
    ctx.price = price;
    ctx.quote_age_s = h.quote_age_s;
    ctx.broker_age_s = h.broker_age_s;
    ctx.stale = h.stale;

    if (intent.side == coordination::Side::BUY) {
        double strategy_exposure = 0.0;
        for (const auto& [symbol, pos] : p.positions) {
            if (pos.strategy_id == intent.strategy_id) {
                strategy_exposure += pos.qty * pos.avg_cost;
            }
        }
        ctx.portfolio_heat = p.exposure / p.nav;
        ctx.strategy_heat = strategy_exposure / p.nav;
        ctx.dd_mult = drawdownMultiplier();
        ctx.requested_qty = intent.size_hint;
        ctx.available_cash = p.cash;
    } else {
        // Closing a long releases cash and heat; only freshness and size apply.
        auto it = p.positions.find(intent.symbol);
        double held = it == p.positions.end() ? 0.0 : it->second.qty;
        ctx.portfolio_heat = 0.0;
        ctx.strategy_heat = 0.0;
        ctx.dd_mult = 1.0;
        ctx.requested_qty = std::min(intent.size_hint, held);
        ctx.available_cash = std::fabs(ctx.requested_qty * price);
    }
    return ctx;
}

std::string Pipeline::nextPlanId(const std::string& strategy_id) {
    std::string prefix;
    for (const capital::Allocation& a : alloc.allocations()) {
        if (a.strategy_ref == strategy_id && a.status == capital::AllocationStatus::ACTIVE) {
            prefix = a.id;
            break;
        }
    }

    uint64_t n;
    {
        std::lock_guard<std::mutex> lock(book_mtx);
        n = ++plan_seq;
    }
    std::ostringstream id;
    if (prefix.empty()) {
        id << "plan_" << clock() << "_" << n;
    } else {
        id << prefix << ":" << clock() << "-" << n;
    }
    return id.str();
}

// --- cycle ---

CycleReport Pipeline::runCycle() {
    CycleReport r;
    r.at = clock();

    std::vector<coordination::TradingSignal> batch;
    {
        std::lock_guard<std::mutex> lock(signal_mtx);
        batch.swap(pending);
    }
    r.signals = batch.size();

    if (trading_halted.load()) {
        r.halted = true;
        if (!batch.empty()) {
            std::cout << "[PIPELINE] halted, discarded " << batch.size() << " signals" << std::endl;
        }
        return r;
    }
    if (batch.empty()) {
        return r;
    }

    std::vector<coordination::WinningIntent> winners =
        coord.pickWinningIntents(batch, stats_book.snapshot());
    r.winners = winners.size();

    for (const coordination::WinningIntent& w : winners) {
        gate::GateContext ctx = gateContext(w, r.at);
        gate::GateDecision d = gate::preTradeGate(ctx, cfg.gate);
        if (!d.accepted()) {
            gate::GateRejection rej;
            rej.ts = r.at;
            rej.symbol = w.symbol;
            rej.strategy_id = w.strategy_id;
            rej.reason = d.reason;
            rej.message = d.message;
            rejection_log.add(rej);
            ++r.rejected;
            std::cout << "[GATE] " << w.key << " REJECT " << gate::toString(d.reason)
                      << ": " << d.message << std::endl;
            continue;
        }

        try {
            TradeOutcome t = execute(w, d.routed_qty);
            ++r.executed;
            if (t.proof && !t.proof->overall.passed) ++r.proofs_failed;
            r.trades.push_back(std::move(t));
        } catch (const BrokerError& e) {
            ++r.broker_errors;
            std::cerr << "[PIPELINE] trade " << w.key << " aborted: " << e.what() << std::endl;
        }
    }

    std::cout << "[PIPELINE] cycle signals=" << r.signals
              << " winners=" << r.winners
              << " rejected=" << r.rejected
              << " executed=" << r.executed
              << " broker_errors=" << r.broker_errors
              << " proofs_failed=" << r.proofs_failed << std::endl;
    return r;
}

TradeOutcome Pipeline::execute(
    const coordination::WinningIntent& intent,
    double routed_qty
) {
    TimestampMs now = clock();
    bool entry = intent.side == coordination::Side::BUY;

    TradeOutcome out;
    out.plan_id = nextPlanId(intent.strategy_id);
    out.symbol = intent.symbol;
    out.strategy_id = intent.strategy_id;
    out.side = entry ? BUY_TO_OPEN : SELL_TO_CLOSE;

    double expected = expectedPrice(intent.symbol, intent.price, now);

    audit::OrderRecord order;
    order.plan_id = out.plan_id;
    order.route = cfg.execution.route;
    order.ladders = {expected};
    order.planned_max_slip = cfg.execution.max_slippage;
    order.ts_created = now;
    audit_store.recordOrder(order);

    Greeks reserved;
    {
        std::lock_guard<std::mutex> lock(book_mtx);
        reserved = greeks;
    }

    std::optional<proof::PreTradePromise> promise;
    if (entry) {
        proof::PreTradePromise p;
        p.option_type = cfg.execution.option_type;
        p.sizing.notional = routed_qty * expected + routed_qty * cfg.execution.fee_per_unit;
        p.sizing.greeks = reserved;
        p.execution_plan.max_slippage = cfg.execution.max_slippage;
        p.promised_net_debit = expected;
        promise = p;
    }

    BrokerOrder bo;
    bo.plan_id = out.plan_id;
    bo.symbol = intent.symbol;
    bo.side = out.side;
    bo.qty = routed_qty;
    bo.limit_price = expected;
    BrokerFill fill = broker_gw->submit(bo);

    out.qty = fill.qty;
    out.price = fill.price;

    double notional = fill.price * fill.qty;
    double cash_before;
    double cash_after;
    Greeks post_trade;
    {
        std::lock_guard<std::mutex> lock(book_mtx);
        cash_before = cash;
        cash += entry ? -(notional + fill.fees) : (notional - fill.fees);
        cash_after = cash;
        applyToPosition(positions, fill.symbol, intent.strategy_id, fill.side, fill.qty, fill.price);
        post_trade = greeks;
    }

    audit::FillRecord fr;
    fr.plan_id = fill.plan_id;
    fr.symbol = fill.symbol;
    fr.side = fill.side;
    fr.price = fill.price;
    fr.qty = fill.qty;
    fr.fees = fill.fees;
    fr.ts_fill = fill.ts_fill;
    fr.broker_attestation = fill.broker_attestation;
    audit_store.recordFill(fr);

    audit::LedgerChangeRecord lc;
    lc.cash_before = cash_before;
    lc.cash_after = cash_after;
    lc.reason = out.side + " " + fill.symbol;
    lc.plan_id = out.plan_id;
    lc.ts_change = fill.ts_fill;
    audit_store.recordLedgerChange(lc);

    if (!entry) {
        return out;
    }

    proof::PostTradeFact fact;
    fact.id = out.plan_id;
    fact.plan_id = out.plan_id;
    fact.symbol = fill.symbol;
    fact.option_type = cfg.execution.option_type;
    fact.side = fill.side;
    fact.price = fill.price;
    fact.qty = fill.qty;
    fact.fees = fill.fees;
    fact.timestamp = fill.ts_fill;
    fact.net_debit = fill.price;
    fact.total_cost = notional + fill.fees;
    fact.cash_before = cash_before;
    fact.cash_after = cash_after;
    fact.portfolio_greeks = post_trade;
    fact.sides = {fill.side};
    fact.broker_attestation = fill.broker_attestation;
    fact.actual_slippage = expected > 0.0 ? std::fabs(fill.price - expected) / expected : 0.0;
    fact.fill_pct = routed_qty > 0.0 ? fill.qty / routed_qty : 0.0;

    proof::Proof p = prover.verifyExecution(promise, fact);
    std::string route;
    try {
        if (auto order = audit_store.orderForPlan(fact.planKey())) {
            route = order->route;
        }
    } catch (const StoreError& e) {
        std::cerr << "[PIPELINE] route lookup for " << fact.planKey()
                  << " failed: " << e.what() << std::endl;
    }
    proofs.append(temporal::summarizeProof(p, fact, route));
    if (!p.overall.passed) {
        std::cerr << proof::formatProofSummary(p, prover.limits()) << std::endl;
    }
    out.proof = std::move(p);
    return out;
}

// --- capital ---

capital::StageResult Pipeline::stage(const capital::StageRequest& req) {
    capital::StageResult r = alloc.stage(req);
    std::cout << "[PIPELINE] stage " << req.strategy_ref << " -> "
              << capital::toString(r.code);
    if (!r.reasons.empty()) std::cout << " (" << joinReasons(r.reasons) << ")";
    std::cout << std::endl;
    return r;
}

capital::RebalanceResult Pipeline::rebalance(
    capital::RebalanceMode mode,
    const std::string& consistency_token
) {
    return alloc.rebalance(mode, consistency_token);
}

size_t Pipeline::killSwitch(const std::string& reason) {
    trading_halted.store(true);
    size_t frozen = alloc.freezeAll(reason);
    std::cerr << "[PIPELINE] CRITICAL kill switch: " << reason
              << " (" << frozen << " allocations frozen, routing halted)" << std::endl;
    return frozen;
}

temporal::TemporalSummary Pipeline::complianceSummary(const std::string& preset) const {
    return summarizer.summarizeTrailing(preset);
}

// --- health ---

void Pipeline::checkStaleness() {
    TimestampMs now = clock();
    HealthSnapshot h = health_monitor.snapshot(now);
    bool stale = !h.quote_age_s ||
                 *h.quote_age_s * 1000.0 > static_cast<double>(cfg.scheduler.staleness_ms);
    if (stale != h.stale) {
        if (stale) {
            std::cerr << "[HEALTH] market data stale" << std::endl;
        } else {
            std::cout << "[HEALTH] market data fresh" << std::endl;
        }
    }
    health_monitor.setStale(stale);
}

}

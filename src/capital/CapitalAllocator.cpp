#include "sentinel/capital/CapitalAllocator.hpp"

#include "sentinel/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sentinel::capital {

namespace {

std::string fmt4(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << v;
    return os.str();
}

double activeTotal(const AllocationState& s) {
    double total = 0.0;
    for (const Allocation& a : s.allocations) {
        if (a.status == AllocationStatus::ACTIVE) {
            total += a.allocation;
        }
    }
    return total;
}

AllocationChange changeOf(
    const Allocation& a,
    const std::string& reason
) {
    AllocationChange c;
    c.id = a.id;
    c.strategy_ref = a.strategy_ref;
    c.allocation = a.allocation;
    c.reason = reason;
    return c;
}

bool belongsTo(
    const std::string& plan_id,
    const std::string& alloc_id
) {
    if (plan_id == alloc_id) return true;
    return plan_id.size() > alloc_id.size() &&
           plan_id.compare(0, alloc_id.size(), alloc_id) == 0 &&
           plan_id[alloc_id.size()] == ':';
}

bool isBuy(const std::string& side) {
    return side == "BUY_TO_OPEN" || side == "BUY" || side == "buy";
}

bool isSell(const std::string& side) {
    return side == "SELL_TO_CLOSE" || side == "SELL" || side == "sell";
}

// Recorded result for a reused token, or for an hour bucket that was
// already executed.
std::optional<RebalanceResult> recordedRebalance(
    const AllocationState& s,
    RebalanceMode mode,
    const std::string& bucket,
    const std::string& consistency_token
) {
    if (!consistency_token.empty()) {
        auto it = s.tokens.find(consistency_token);
        if (it != s.tokens.end()) {
            RebalanceResult r = it->second;
            r.status = RebalanceStatus::REPLAYED;
            return r;
        }
    }
    if (mode == RebalanceMode::EXECUTE) {
        auto it = s.buckets.find(bucket);
        if (it != s.buckets.end()) {
            RebalanceResult r = it->second;
            r.status = RebalanceStatus::REPLAYED;
            return r;
        }
    }
    return std::nullopt;
}

}

CapitalAllocator::CapitalAllocator(
    const audit::AuditStore* store,
    AllocatorOptions opts,
    PromotionThresholds promotion,
    PoolCapParams cap_params,
    infra::WallClock clock
) : store(store),
    opts(opts),
    promotion(promotion),
    cap_params(cap_params),
    clock(std::move(clock)),
    book(this->opts.state_file) {
    state = book.load();
    std::cout << "[ALLOC] loaded " << state.allocations.size()
              << " allocations from "
              << (book.path().empty() ? "memory" : book.path())
              << (state.frozen ? " (FROZEN)" : "") << std::endl;
}

void CapitalAllocator::setComplianceCheck(ComplianceCheck check) {
    std::lock_guard<std::mutex> lock(mtx);
    compliance = std::move(check);
}

void CapitalAllocator::setMetricsSource(MetricsSource source) {
    std::lock_guard<std::mutex> lock(mtx);
    metrics = std::move(source);
}

void CapitalAllocator::setCapObserver(CapObserver observer) {
    std::lock_guard<std::mutex> lock(mtx);
    cap_observer = std::move(observer);
}

PrecheckResult CapitalAllocator::precheck(const StrategyPerformance& perf) const {
    return precheckPromotion(perf, promotion);
}

ProductionMetrics CapitalAllocator::readMetrics(bool* degraded) const {
    ProductionMetrics m;
    if (!metrics) return m;
    try {
        m = metrics();
    } catch (const std::exception& e) {
        // Unknown production health takes the minimum cap.
        std::cerr << "[ALLOC] production metrics unavailable: " << e.what() << std::endl;
        m.sharpe_20d = 0.0;
        m.drawdown = std::nan("");
        if (degraded) *degraded = true;
    }
    return m;
}

// ------------------------------------------------------------
// stage
// ------------------------------------------------------------

StageResult CapitalAllocator::stage(const StageRequest& req) {
    std::lock_guard<std::mutex> lock(mtx);
    TimestampMs now = clock();
    StageResult out;

    if (!req.consistency_token.empty()) {
        for (const Allocation& a : state.allocations) {
            if (a.consistency_token == req.consistency_token &&
                a.session_id == req.session_id &&
                a.strategy_ref == req.strategy_ref) {
                out.code = StageCode::REPLAYED;
                out.allocation = a;
                return out;
            }
        }
    }

    if (req.session_id.empty()) out.reasons.push_back("session_id required");
    if (req.strategy_ref.empty()) out.reasons.push_back("strategy_ref required");
    if (!std::isfinite(req.allocation) || req.allocation <= 0.0 || req.allocation > 1.0) {
        out.reasons.push_back("allocation must be in (0,1]");
    }
    if (!std::isfinite(req.ttl_days) || req.ttl_days <= 0.0) {
        out.reasons.push_back("ttl_days must be positive");
    }
    if (!out.reasons.empty()) {
        out.code = StageCode::INVALID_REQUEST;
        return out;
    }

    if (state.frozen) {
        out.code = StageCode::FROZEN;
        out.reasons.push_back("allocations frozen: " + state.freeze_reason);
        return out;
    }

    out.precheck = precheckPromotion(req.performance, promotion);
    if (!out.precheck.pass) {
        out.code = StageCode::PRECHECK_FAILED;
        for (const PrecheckFailure& f : out.precheck.failures) {
            out.reasons.push_back(f.message);
        }
        return out;
    }

    if (compliance) {
        std::optional<std::string> why;
        try {
            why = compliance(req);
        } catch (const std::exception& e) {
            why = std::string("compliance check error: ") + e.what();
        }
        if (why) {
            out.code = StageCode::COMPLIANCE_FAILED;
            out.reasons.push_back(*why);
            return out;
        }
    }

    // No stage without recent NBBO.
    std::string stale;
    if (!store) {
        stale = "no market data store";
    } else {
        try {
            std::optional<audit::QuoteRecord> q;
            if (req.reference_symbol.empty()) {
                q = store->latestQuote();
                if (q && now - q->ts_recv > opts.nbbo_max_age_ms) {
                    q.reset();
                }
            } else {
                q = store->latestFreshQuote(req.reference_symbol, opts.nbbo_max_age_ms, now);
            }
            if (!q) {
                stale = "no NBBO within " + std::to_string(opts.nbbo_max_age_ms / 1000) + "s";
            }
        } catch (const StoreError& e) {
            stale = e.what();
        }
    }
    if (!stale.empty()) {
        out.code = StageCode::STALE_MARKET_DATA;
        out.reasons.push_back(stale);
        return out;
    }

    AllocationState next = state;
    Allocation a;
    a.seq = next.next_seq++;
    a.id = "alloc_" + std::to_string(now) + "_" + std::to_string(a.seq);
    a.session_id = req.session_id;
    a.strategy_ref = req.strategy_ref;
    a.pool = req.pool;
    a.allocation = req.allocation;
    a.status = AllocationStatus::STAGED;
    a.ttl_until = now + static_cast<TimestampMs>(std::llround(req.ttl_days * infra::MS_PER_DAY));
    a.consistency_token = req.consistency_token;
    a.created_at = now;
    next.allocations.push_back(a);

    try {
        book.save(next);
    } catch (const StoreError& e) {
        std::cerr << "[ALLOC] stage not persisted: " << e.what() << std::endl;
        out.code = StageCode::STORE_ERROR;
        out.reasons.push_back(e.what());
        return out;
    }
    state = std::move(next);

    std::cout << "[ALLOC] staged " << a.id << " " << a.strategy_ref
              << " alloc=" << fmt4(a.allocation) << std::endl;

    out.code = StageCode::STAGED;
    out.allocation = a;
    return out;
}

// ------------------------------------------------------------
// rebalance
// ------------------------------------------------------------

RebalanceResult CapitalAllocator::computeRebalance(
    AllocationState& s,
    TimestampMs now,
    double cap
) const {
    const double tol = opts.cap_tolerance;
    RebalanceResult r;
    r.pool_cap = cap;
    r.at = now;

    double total = activeTotal(s);
    r.total_before = total;

    // 1. TTL
    for (Allocation& a : s.allocations) {
        if (a.ttl_until > now) continue;
        if (a.status == AllocationStatus::ACTIVE) {
            a.status = AllocationStatus::EXPIRED;
            a.status_reason = "ttl expired";
            total -= a.allocation;
            r.expired.push_back(changeOf(a, a.status_reason));
        } else if (a.status == AllocationStatus::STAGED) {
            a.status = AllocationStatus::EXPIRED;
            a.status_reason = "ttl expired before activation";
            r.expired.push_back(changeOf(a, a.status_reason));
        }
    }

    // 2. cap contracted below what is already active: newest go first
    if (total > cap + tol) {
        std::vector<Allocation*> active;
        for (Allocation& a : s.allocations) {
            if (a.status == AllocationStatus::ACTIVE) active.push_back(&a);
        }
        std::sort(active.begin(), active.end(), [](const Allocation* x, const Allocation* y) {
            if (x->activated_at != y->activated_at) return x->activated_at > y->activated_at;
            return x->seq > y->seq;
        });
        for (Allocation* a : active) {
            if (total <= cap + tol) break;
            a->status = AllocationStatus::EXPIRED;
            a->status_reason = "pool cap contracted";
            total -= a->allocation;
            r.expired.push_back(changeOf(*a, a->status_reason));
        }
    }

    // 3. staged, FIFO
    std::vector<Allocation*> staged;
    for (Allocation& a : s.allocations) {
        if (a.status == AllocationStatus::STAGED) staged.push_back(&a);
    }
    std::sort(staged.begin(), staged.end(), [](const Allocation* x, const Allocation* y) {
        if (x->created_at != y->created_at) return x->created_at < y->created_at;
        return x->seq < y->seq;
    });
    for (Allocation* a : staged) {
        double would = total + a->allocation;
        if (would <= cap + tol) {
            a->status = AllocationStatus::ACTIVE;
            a->activated_at = now;
            a->status_reason = "within pool cap";
            total = would;
            r.activated.push_back(changeOf(*a, a->status_reason));
        } else {
            a->status = AllocationStatus::EXPIRED;
            a->status_reason = "would exceed pool cap " + fmt4(cap) +
                               " (would be " + fmt4(would) + ")";
            r.rejected.push_back(changeOf(*a, a->status_reason));
        }
    }

    r.total_after = std::max(total, 0.0);
    return r;
}

RebalanceResult CapitalAllocator::rebalance(
    RebalanceMode mode,
    const std::string& consistency_token
) {
    std::lock_guard<std::mutex> lock(mtx);
    TimestampMs now = clock();
    std::string bucket = infra::hourBucket(now);

    if (auto replay = recordedRebalance(state, mode, bucket, consistency_token)) {
        return *replay;
    }

    double cap = computePoolCap(cap_params, readMetrics(nullptr));

    RebalanceResult skipped;
    skipped.bucket = bucket;
    skipped.consistency_token = consistency_token;
    skipped.at = now;
    skipped.pool_cap = cap;
    skipped.total_before = activeTotal(state);
    skipped.total_after = skipped.total_before;

    auto frozenResult = [&]() {
        skipped.status = RebalanceStatus::FROZEN;
        skipped.message = "allocations frozen: " + state.freeze_reason;
        std::cout << "[ALLOC] rebalance skipped, " << skipped.message << std::endl;
        return skipped;
    };

    // Kill switch: nothing staged is activated until staging resumes.
    if (state.frozen) {
        return frozenResult();
    }

    if (mode == RebalanceMode::PREVIEW) {
        AllocationState scratch = state;
        RebalanceResult r = computeRebalance(scratch, now, cap);
        r.status = RebalanceStatus::PREVIEW;
        r.bucket = bucket;
        r.consistency_token = consistency_token;
        return r;
    }

    std::optional<BatchLock> batch;
    if (!book.path().empty()) {
        batch.emplace(book.lockPath(), opts.lock_stale_ms, now);
        if (!batch->held()) {
            skipped.status = RebalanceStatus::LOCKED;
            skipped.message = "rebalance lock held: " + batch->holderInfo();
            std::cout << "[ALLOC] rebalance skipped, " << skipped.message << std::endl;
            return skipped;
        }

        // Another process may have written since this one last loaded.
        try {
            state = book.load();
        } catch (const StoreError& e) {
            std::cerr << "[ALLOC] rebalance aborted: " << e.what() << std::endl;
            skipped.status = RebalanceStatus::FAILED;
            skipped.message = e.what();
            return skipped;
        }
        if (auto replay = recordedRebalance(state, mode, bucket, consistency_token)) {
            return *replay;
        }
        if (state.frozen) {
            return frozenResult();
        }
    }

    AllocationState next = state;
    RebalanceResult r = computeRebalance(next, now, cap);
    r.status = RebalanceStatus::APPLIED;
    r.bucket = bucket;
    r.consistency_token = consistency_token;
    next.buckets[bucket] = r;
    if (!consistency_token.empty()) {
        next.tokens[consistency_token] = r;
    }

    try {
        book.save(next);
    } catch (const StoreError& e) {
        std::cerr << "[ALLOC] rebalance not persisted: " << e.what() << std::endl;
        r.status = RebalanceStatus::FAILED;
        r.message = e.what();
        return r;
    }
    state = std::move(next);

    std::cout << "[ALLOC] rebalance " << bucket
              << " cap=" << fmt4(cap)
              << " total=" << fmt4(r.total_before) << "->" << fmt4(r.total_after)
              << " activated=" << r.activated.size()
              << " rejected=" << r.rejected.size()
              << " expired=" << r.expired.size() << std::endl;

    if (cap_observer) {
        cap_observer(now, r.total_after, cap);
    }
    return r;
}

// ------------------------------------------------------------
// Read projections
// ------------------------------------------------------------

LedgerView CapitalAllocator::ledger() const {
    std::lock_guard<std::mutex> lock(mtx);
    LedgerView view;
    view.as_of = clock();
    if (!store) {
        view.degraded = true;
    }

    for (const Allocation& a : state.allocations) {
        LedgerEntry e;
        e.allocation = a;

        if (store) {
            try {
                double buy_qty = 0.0;
                double buy_cost = 0.0;
                double sell_qty = 0.0;
                double sell_proceeds = 0.0;
                double fees = 0.0;
                std::string symbol;

                for (const audit::FillRecord& f : store->fillsWithPlanPrefix(a.id)) {
                    if (!belongsTo(f.plan_id, a.id)) continue;
                    ++e.fills;
                    fees += f.fees;
                    if (isBuy(f.side)) {
                        buy_qty += f.qty;
                        buy_cost += f.price * f.qty;
                        symbol = f.symbol;
                    } else if (isSell(f.side)) {
                        sell_qty += f.qty;
                        sell_proceeds += f.price * f.qty;
                    }
                }

                e.avg_cost = buy_qty > 0.0 ? buy_cost / buy_qty : 0.0;
                double closed = std::min(sell_qty, buy_qty);
                e.realized_pnl = sell_proceeds - closed * e.avg_cost - fees;
                e.open_qty = std::max(buy_qty - sell_qty, 0.0);

                if (e.open_qty > 0.0 && !symbol.empty()) {
                    if (auto q = store->latestQuoteFor(symbol)) {
                        double mark = q->bid > 0.0 ? q->bid : q->mid;
                        if (mark > 0.0) {
                            e.unrealized_pnl = e.open_qty * (mark - e.avg_cost);
                            e.marked = true;
                        }
                    }
                }
            } catch (const StoreError& err) {
                std::cerr << "[ALLOC] ledger read for " << a.id
                          << " degraded: " << err.what() << std::endl;
                view.degraded = true;
                e.realized_pnl = 0.0;
                e.unrealized_pnl = 0.0;
            }
        }

        view.realized_pnl += e.realized_pnl;
        view.unrealized_pnl += e.unrealized_pnl;
        view.entries.push_back(std::move(e));
    }
    return view;
}

double CapitalAllocator::equity() const {
    if (!store) {
        return opts.default_equity;
    }
    std::optional<audit::LedgerChangeRecord> last = store->latestLedgerChange();
    return last ? last->cash_after : opts.default_equity;
}

PoolStatus CapitalAllocator::poolStatus() const {
    std::lock_guard<std::mutex> lock(mtx);
    PoolStatus ps;
    ps.as_of = clock();
    ps.frozen = state.frozen;

    ProductionMetrics m = readMetrics(&ps.degraded);
    ps.cap_pct = computePoolCap(cap_params, m);

    try {
        ps.equity = equity();
    } catch (const StoreError& e) {
        std::cerr << "[ALLOC] pool status equity: " << e.what() << std::endl;
        ps.equity = opts.default_equity;
        ps.degraded = true;
    }

    double total = 0.0;
    for (const Allocation& a : state.allocations) {
        if (a.status == AllocationStatus::ACTIVE) {
            total += a.allocation;
            ++ps.active_count;
        }
    }
    ps.utilization_pct = std::round(total * 10000.0) / 10000.0;
    ps.available_capacity = ps.cap_pct - total;
    if (!std::isfinite(m.drawdown) || m.drawdown > 0.10) {
        ps.risk_level = "high";
    } else if (m.drawdown > 0.05) {
        ps.risk_level = "medium";
    } else {
        ps.risk_level = "low";
    }
    return ps;
}

double CapitalAllocator::currentPoolCap() const {
    std::lock_guard<std::mutex> lock(mtx);
    return computePoolCap(cap_params, readMetrics(nullptr));
}

// ------------------------------------------------------------
// Kill switch
// ------------------------------------------------------------

size_t CapitalAllocator::freezeAll(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx);
    size_t n = 0;
    for (Allocation& a : state.allocations) {
        if (a.status == AllocationStatus::ACTIVE) {
            a.status = AllocationStatus::FROZEN;
            a.status_reason = reason;
            ++n;
        }
    }
    state.frozen = true;
    state.freeze_reason = reason;

    std::cerr << "[ALLOC] CRITICAL kill switch: " << n
              << " allocations frozen (" << reason << ")" << std::endl;

    // The freeze holds in memory even if it cannot be persisted.
    try {
        book.save(state);
    } catch (const StoreError& e) {
        std::cerr << "[ALLOC] CRITICAL freeze not persisted: " << e.what() << std::endl;
    }
    return n;
}

void CapitalAllocator::resumeStaging() {
    std::lock_guard<std::mutex> lock(mtx);
    AllocationState next = state;
    next.frozen = false;
    next.freeze_reason.clear();
    book.save(next);
    state = std::move(next);
    std::cout << "[ALLOC] staging resumed" << std::endl;
}

bool CapitalAllocator::frozen() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state.frozen;
}

std::vector<Allocation> CapitalAllocator::allocations() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state.allocations;
}

std::optional<Allocation> CapitalAllocator::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    for (const Allocation& a : state.allocations) {
        if (a.id == id) return a;
    }
    return std::nullopt;
}

}

#include "sentinel/audit/AuditStore.hpp"

#include "sentinel/core/Errors.hpp"
#include "sentinel/infra/Sha256.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace sentinel::audit {

namespace {

const std::string GENESIS(64, '0');

struct ParsedLine {
    std::string payload;
    std::string hash;
};

bool splitLine(
    const std::string& line,
    ParsedLine& out
) {
    size_t tab = line.rfind('\t');
    if (tab == std::string::npos || tab + 1 >= line.size()) {
        return false;
    }
    out.payload = line.substr(0, tab);
    out.hash = line.substr(tab + 1);
    return true;
}

void noteError(
    IntegrityReport& r,
    const std::string& what
) {
    r.intact = false;
    if (r.first_error.empty()) {
        r.first_error = what;
    }
}

template <typename Fn>
void walkJournal(
    const std::vector<std::string>& lines,
    IntegrityReport& report,
    Fn&& onRecord
) {
    std::string prev = GENESIS;
    uint64_t lineno = 0;

    for (const std::string& line : lines) {
        ++lineno;
        ParsedLine pl;
        if (!splitLine(line, pl)) {
            ++report.bad_lines;
            noteError(report, "line " + std::to_string(lineno) + ": no hash");
            continue;
        }

        json::object payload;
        try {
            payload = infra::requireObject(json::parse(pl.payload), "journal line");
        } catch (const std::exception& e) {
            ++report.bad_lines;
            noteError(report, "line " + std::to_string(lineno) + ": " + e.what());
            continue;
        }

        std::string linked = infra::stringOr(payload, "prev", "");
        bool broken = false;
        if (linked != prev) {
            broken = true;
            noteError(report, "line " + std::to_string(lineno) + ": prev link mismatch");
        }
        if (infra::sha256Hex(pl.payload) != pl.hash) {
            broken = true;
            noteError(report, "line " + std::to_string(lineno) + ": hash mismatch");
        }
        if (broken) {
            ++report.chain_breaks;
        }

        prev = pl.hash;
        ++report.records;
        onRecord(payload, pl.hash);
    }
    report.last_hash = prev;
}

}

IntegrityReport verifyJournal(const std::vector<std::string>& lines) {
    IntegrityReport report;
    walkJournal(lines, report, [](const json::object&, const std::string&) {});
    return report;
}

AuditStore::AuditStore(
    std::unique_ptr<IAuditJournal> journal,
    AuditStamper stamper,
    AuditOptions opts
) : journal(std::move(journal)),
    stamp_source(std::move(stamper)),
    opts(std::move(opts)),
    last_hash(GENESIS) {
    if (!this->journal) {
        throw StoreError("audit store needs a journal");
    }
    replay();
}

void AuditStore::replay() {
    std::vector<std::string> lines = journal->readAll();

    IntegrityReport report;
    walkJournal(lines, report, [this](const json::object& payload, const std::string& hash) {
        try {
            uint64_t seq = static_cast<uint64_t>(infra::intOr(payload, "seq", 0));
            std::string type = infra::stringOr(payload, "type", "");
            const json::object* record = infra::objectAt(payload, "record");
            const json::object* stamp = infra::objectAt(payload, "stamp");
            if (record && stamp) {
                index(seq, type, *record, stampFromJson(*stamp), hash);
            }
            next_seq = std::max(next_seq, seq + 1);
        } catch (const std::exception& e) {
            std::cerr << "[AUDIT] unindexable record: " << e.what() << std::endl;
        }
    });

    last_hash = report.last_hash;
    open_report = report;

    std::cout << "[AUDIT] journal " << journal->location()
              << " replayed records=" << report.records
              << " next_seq=" << next_seq << std::endl;

    if (!report.intact) {
        std::cerr << "[AUDIT] CRITICAL journal integrity broken: "
                  << report.first_error
                  << " (chain_breaks=" << report.chain_breaks
                  << " bad_lines=" << report.bad_lines << ")" << std::endl;
    }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

bool AuditStore::append(
    const char* type,
    json::object record,
    TimestampMs ts_feed,
    TimestampMs ts_recv
) {
    std::unique_lock<std::timed_mutex> lock(
        mtx,
        std::chrono::milliseconds(opts.write_timeout_ms)
    );
    if (!lock.owns_lock()) {
        ++dropped;
        std::cerr << "[AUDIT] write timeout, " << type
                  << " record dropped" << std::endl;
        return false;
    }

    AuditStamp stamp = stamp_source.stamp(ts_feed, ts_recv);
    uint64_t seq = next_seq;

    json::object payload;
    payload["seq"] = seq;
    payload["type"] = type;
    payload["prev"] = last_hash;
    payload["record"] = record;
    payload["stamp"] = toJson(stamp);

    std::string text = json::serialize(payload);
    std::string hash;
    try {
        hash = infra::sha256Hex(text);
        journal->append(text + '\t' + hash);
    } catch (const StoreError& e) {
        ++dropped;
        std::cerr << "[AUDIT] " << type << " record dropped: "
                  << e.what() << std::endl;
        return false;
    }

    last_hash = hash;
    ++next_seq;
    index(seq, type, record, stamp, hash);
    return true;
}

bool AuditStore::recordQuote(const QuoteRecord& q) {
    QuoteRecord copy = q;
    copy.mid = midOf(q.bid, q.ask);
    return append("quote", toJson(copy), q.ts_feed, q.ts_recv);
}

bool AuditStore::recordChain(const std::vector<ChainLegRecord>& legs) {
    bool all = true;
    for (const ChainLegRecord& leg : legs) {
        if (!append("chain_leg", toJson(leg), leg.ts_feed, leg.ts_recv)) {
            all = false;
        }
    }
    return all;
}

bool AuditStore::recordOrder(const OrderRecord& o) {
    return append("order", toJson(o), o.ts_created, o.ts_created);
}

bool AuditStore::recordFill(const FillRecord& f) {
    return append("fill", toJson(f), f.ts_fill, f.ts_fill);
}

bool AuditStore::recordLedgerChange(const LedgerChangeRecord& l) {
    return append("ledger_change", toJson(l), l.ts_change, l.ts_change);
}

void AuditStore::index(
    uint64_t seq,
    const std::string& type,
    const json::object& record,
    const AuditStamp& stamp,
    const std::string& hash
) {
    if (type == "quote") {
        quotes_by_symbol[infra::stringOr(record, "symbol", "")].push_back(quotes.size());
        quotes.push_back(quoteFromJson(record));
    } else if (type == "chain_leg") {
        chain_legs.push_back(chainLegFromJson(record));
    } else if (type == "order") {
        OrderRecord o = orderFromJson(record);
        std::string id = o.plan_id;
        orders[id] = std::move(o);
    } else if (type == "fill") {
        fills_by_plan[infra::stringOr(record, "plan_id", "")].push_back(fills.size());
        fills.push_back(fillFromJson(record));
    } else if (type == "ledger_change") {
        ledger.push_back(ledgerChangeFromJson(record));
    } else {
        std::cerr << "[AUDIT] unknown record type " << type
                  << " seq=" << seq << std::endl;
        return;
    }

    AuditTrailEntry entry;
    entry.seq = seq;
    entry.record_type = type;
    entry.stamp = stamp;
    entry.hash = hash;
    trail.push_back(std::move(entry));
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::unique_lock<std::timed_mutex> AuditStore::readLock() const {
    std::unique_lock<std::timed_mutex> lock(
        mtx,
        std::chrono::milliseconds(opts.read_timeout_ms)
    );
    if (!lock.owns_lock()) {
        throw StoreError("read timeout");
    }
    return lock;
}

std::optional<QuoteRecord> AuditStore::latestFreshQuote(
    const std::string& symbol,
    int64_t max_age_ms,
    TimestampMs now
) const {
    auto lock = readLock();
    auto it = quotes_by_symbol.find(symbol);
    if (it == quotes_by_symbol.end()) {
        return std::nullopt;
    }

    const QuoteRecord* best = nullptr;
    for (size_t idx : it->second) {
        const QuoteRecord& q = quotes[idx];
        if (now - q.ts_recv > max_age_ms) continue;
        if (!best || q.ts_recv >= best->ts_recv) {
            best = &q;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<QuoteRecord> AuditStore::latestQuote() const {
    auto lock = readLock();
    const QuoteRecord* best = nullptr;
    for (const QuoteRecord& q : quotes) {
        if (!best || q.ts_recv >= best->ts_recv) {
            best = &q;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<QuoteRecord> AuditStore::latestQuoteFor(
    const std::string& symbol
) const {
    auto lock = readLock();
    auto it = quotes_by_symbol.find(symbol);
    if (it == quotes_by_symbol.end()) {
        return std::nullopt;
    }
    const QuoteRecord* best = nullptr;
    for (size_t idx : it->second) {
        if (!best || quotes[idx].ts_recv >= best->ts_recv) {
            best = &quotes[idx];
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<NbboSnapshot> AuditStore::nbboAt(
    const std::string& symbol,
    TimestampMs ts,
    int64_t tolerance_ms
) const {
    auto lock = readLock();
    auto it = quotes_by_symbol.find(symbol);
    if (it == quotes_by_symbol.end()) {
        return std::nullopt;
    }

    const QuoteRecord* best = nullptr;
    int64_t best_dist = 0;
    for (size_t idx : it->second) {
        const QuoteRecord& q = quotes[idx];
        if (q.mid <= 0.0) continue;
        int64_t dist = std::llabs(q.ts_recv - ts);
        if (dist > tolerance_ms) continue;
        if (!best ||
            dist < best_dist ||
            (dist == best_dist && q.ts_recv < best->ts_recv)) {
            best = &q;
            best_dist = dist;
        }
    }
    if (!best) return std::nullopt;

    NbboSnapshot snap;
    snap.bid = best->bid;
    snap.ask = best->ask;
    snap.mid = best->mid;
    snap.ts_recv = best->ts_recv;
    return snap;
}

std::vector<QuoteRecord> AuditStore::quotesInWindow(
    TimestampMs start,
    TimestampMs end
) const {
    auto lock = readLock();
    std::vector<QuoteRecord> out;
    for (const QuoteRecord& q : quotes) {
        if (q.ts_recv >= start && q.ts_recv < end) {
            out.push_back(q);
        }
    }
    return out;
}

std::vector<ChainLegRecord> AuditStore::chainLegs(
    const std::string& symbol,
    const std::string& expiry
) const {
    auto lock = readLock();
    std::vector<ChainLegRecord> out;
    for (const ChainLegRecord& c : chain_legs) {
        if (c.symbol == symbol && (expiry.empty() || c.expiry == expiry)) {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<OrderRecord> AuditStore::orderForPlan(
    const std::string& plan_id
) const {
    auto lock = readLock();
    auto it = orders.find(plan_id);
    if (it == orders.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FillRecord> AuditStore::fillsForPlan(
    const std::string& plan_id
) const {
    auto lock = readLock();
    std::vector<FillRecord> out;
    auto it = fills_by_plan.find(plan_id);
    if (it != fills_by_plan.end()) {
        for (size_t idx : it->second) {
            out.push_back(fills[idx]);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const FillRecord& a, const FillRecord& b) {
        return a.ts_fill < b.ts_fill;
    });
    return out;
}

std::vector<FillRecord> AuditStore::fillsWithPlanPrefix(
    const std::string& prefix
) const {
    auto lock = readLock();
    std::vector<FillRecord> out;
    for (auto it = fills_by_plan.lower_bound(prefix); it != fills_by_plan.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        for (size_t idx : it->second) {
            out.push_back(fills[idx]);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const FillRecord& a, const FillRecord& b) {
        return a.ts_fill < b.ts_fill;
    });
    return out;
}

std::vector<FillRecord> AuditStore::fillsInWindow(
    TimestampMs start,
    TimestampMs end
) const {
    auto lock = readLock();
    std::vector<FillRecord> out;
    for (const FillRecord& f : fills) {
        if (f.ts_fill >= start && f.ts_fill < end) {
            out.push_back(f);
        }
    }
    return out;
}

std::vector<LedgerChangeRecord> AuditStore::ledgerChanges(
    TimestampMs start,
    TimestampMs end
) const {
    auto lock = readLock();
    std::vector<LedgerChangeRecord> out;
    for (const LedgerChangeRecord& l : ledger) {
        if (l.ts_change >= start && l.ts_change < end) {
            out.push_back(l);
        }
    }
    return out;
}

std::optional<LedgerChangeRecord> AuditStore::latestLedgerChange() const {
    auto lock = readLock();
    const LedgerChangeRecord* best = nullptr;
    for (const LedgerChangeRecord& l : ledger) {
        if (!best || l.ts_change >= best->ts_change) {
            best = &l;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

FrictionStats AuditStore::frictionStats(
    TimestampMs start,
    TimestampMs end
) const {
    auto lock = readLock();
    FrictionStats st;
    double sum = 0.0;
    uint64_t priced = 0;

    for (const FillRecord& f : fills) {
        if (f.ts_fill < start || f.ts_fill >= end) continue;
        ++st.total_fills;

        double notional = f.price * f.qty;
        if (!std::isfinite(notional) || notional <= 0.0 || !std::isfinite(f.fees)) {
            continue;
        }
        double friction = f.fees / notional;
        sum += friction;
        ++priced;
        if (friction <= 0.20) ++st.friction_20_count;
        if (friction <= 0.25) ++st.friction_25_count;
    }

    if (priced > 0) {
        st.avg_friction = sum / static_cast<double>(priced);
    }
    return st;
}

std::vector<AuditTrailEntry> AuditStore::auditTrail() const {
    auto lock = readLock();
    return trail;
}

IntegrityReport AuditStore::verifyChain() const {
    auto lock = readLock();
    return verifyJournal(journal->readAll());
}

IntegrityReport AuditStore::integrity() const {
    auto lock = readLock();
    return open_report;
}

uint64_t AuditStore::size() const {
    auto lock = readLock();
    return trail.size();
}

}

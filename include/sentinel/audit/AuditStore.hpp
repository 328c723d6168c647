#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditJournal.hpp"
#include "sentinel/audit/AuditRecords.hpp"
#include "sentinel/audit/AuditStamper.hpp"

namespace sentinel::audit {

struct AuditOptions {
    std::string journal_file = "audit.jsonl";
    int64_t write_timeout_ms = 250;
    int64_t read_timeout_ms = 250;
};

struct AuditTrailEntry {
    uint64_t seq = 0;
    std::string record_type;
    AuditStamp stamp;
    std::string hash;
};

struct IntegrityReport {
    bool intact = true;
    uint64_t records = 0;
    uint64_t bad_lines = 0;
    uint64_t chain_breaks = 0;
    std::string last_hash;
    std::string first_error;
};

// Walks a journal and checks every line hash and prev link.
IntegrityReport verifyJournal(const std::vector<std::string>& lines);

// ============================================================
// AuditStore
//
// Write-once store of quotes, chain legs, orders, fills and ledger
// changes. Every write appends one hash-chained line to the journal
// and is indexed in memory only after the append succeeded.
//
// Writes never throw: a journal failure or lock timeout is logged and
// reported as false so the trading action that triggered it proceeds.
// Reads throw StoreError when the store stays locked past
// read_timeout_ms.
// ============================================================
class AuditStore {
public:
    AuditStore(
        std::unique_ptr<IAuditJournal> journal,
        AuditStamper stamper,
        AuditOptions opts = AuditOptions()
    );

    AuditStore(const AuditStore&) = delete;
    AuditStore& operator=(const AuditStore&) = delete;

    // --- writes ---
    bool recordQuote(const QuoteRecord& q);
    bool recordChain(const std::vector<ChainLegRecord>& legs);
    bool recordOrder(const OrderRecord& o);
    bool recordFill(const FillRecord& f);
    bool recordLedgerChange(const LedgerChangeRecord& l);

    // --- reads (copies) ---
    std::optional<QuoteRecord> latestFreshQuote(
        const std::string& symbol,
        int64_t max_age_ms,
        TimestampMs now
    ) const;

    std::optional<QuoteRecord> latestQuote() const;

    std::optional<QuoteRecord> latestQuoteFor(
        const std::string& symbol
    ) const;

    std::optional<NbboSnapshot> nbboAt(
        const std::string& symbol,
        TimestampMs ts,
        int64_t tolerance_ms
    ) const;

    std::vector<QuoteRecord> quotesInWindow(
        TimestampMs start,
        TimestampMs end
    ) const;

    std::vector<ChainLegRecord> chainLegs(
        const std::string& symbol,
        const std::string& expiry
    ) const;

    std::optional<OrderRecord> orderForPlan(
        const std::string& plan_id
    ) const;

    std::vector<FillRecord> fillsForPlan(
        const std::string& plan_id
    ) const;

    std::vector<FillRecord> fillsWithPlanPrefix(
        const std::string& prefix
    ) const;

    std::vector<FillRecord> fillsInWindow(
        TimestampMs start,
        TimestampMs end
    ) const;

    std::vector<LedgerChangeRecord> ledgerChanges(
        TimestampMs start,
        TimestampMs end
    ) const;

    std::optional<LedgerChangeRecord> latestLedgerChange() const;

    FrictionStats frictionStats(
        TimestampMs start,
        TimestampMs end
    ) const;

    std::vector<AuditTrailEntry> auditTrail() const;

    // Re-reads the journal and checks the whole chain.
    IntegrityReport verifyChain() const;

    // Result of the replay done at open.
    IntegrityReport integrity() const;

    uint64_t size() const;
    uint64_t droppedWrites() const { return dropped.load(); }

    const AuditStamper& stamper() const { return stamp_source; }
    TimestampMs now() const { return stamp_source.now(); }

private:
    bool append(
        const char* type,
        json::object record,
        TimestampMs ts_feed,
        TimestampMs ts_recv
    );

    void index(
        uint64_t seq,
        const std::string& type,
        const json::object& record,
        const AuditStamp& stamp,
        const std::string& hash
    );

    void replay();

    std::unique_lock<std::timed_mutex> readLock() const;

    std::unique_ptr<IAuditJournal> journal;
    AuditStamper stamp_source;
    AuditOptions opts;

    mutable std::timed_mutex mtx;
    std::string last_hash;
    uint64_t next_seq = 1;
    IntegrityReport open_report;
    std::atomic<uint64_t> dropped{0};

    std::vector<QuoteRecord> quotes;
    std::map<std::string, std::vector<size_t>> quotes_by_symbol;
    std::vector<ChainLegRecord> chain_legs;
    std::map<std::string, OrderRecord> orders;
    std::vector<FillRecord> fills;
    std::map<std::string, std::vector<size_t>> fills_by_plan;
    std::vector<LedgerChangeRecord> ledger;
    std::vector<AuditTrailEntry> trail;
};

}

#pragma once

#include <string>
#include <vector>

#include "sentinel/core/Greeks.hpp"
#include "sentinel/infra/Clock.hpp"
#include "sentinel/infra/Json.hpp"

namespace sentinel::audit {

using infra::TimestampMs;
namespace json = boost::json;

// Provenance attached to every journal record.
struct AuditStamp {
    TimestampMs server_ts = 0;
    TimestampMs ts_feed = 0;
    TimestampMs ts_recv = 0;
    std::string commit_hash;
    std::string policy_hash;
    std::string environment;
    bool worm_mode = true;
};

struct QuoteRecord {
    std::string symbol;
    double bid = 0.0;
    double ask = 0.0;
    double mid = 0.0;   // 0 unless both sides are present
    TimestampMs ts_feed = 0;
    TimestampMs ts_recv = 0;
    std::string source = "feed";
};

struct ChainLegRecord {
    std::string symbol;
    std::string expiry;
    double strike = 0.0;
    double bid = 0.0;
    double ask = 0.0;
    int64_t oi = 0;
    int64_t vol = 0;
    Greeks greeks;
    double iv = 0.0;
    TimestampMs ts_feed = 0;
    TimestampMs ts_recv = 0;
    std::string source = "feed";
};

struct OrderRecord {
    std::string plan_id;
    std::string route;
    std::vector<double> ladders;
    double planned_max_slip = 0.0;
    TimestampMs ts_created = 0;
};

struct FillRecord {
    std::string plan_id;
    std::string symbol;
    std::string side;
    double price = 0.0;
    double qty = 0.0;
    double fees = 0.0;
    TimestampMs ts_fill = 0;
    std::string broker_attestation;
};

struct LedgerChangeRecord {
    double cash_before = 0.0;
    double cash_after = 0.0;
    std::string reason;
    std::string plan_id;
    TimestampMs ts_change = 0;
};

struct NbboSnapshot {
    double bid = 0.0;
    double ask = 0.0;
    double mid = 0.0;
    TimestampMs ts_recv = 0;
};

struct FrictionStats {
    uint64_t total_fills = 0;
    double avg_friction = 0.0;
    uint64_t friction_20_count = 0;
    uint64_t friction_25_count = 0;
};

double midOf(double bid, double ask);

json::object toJson(const AuditStamp& s);
json::object toJson(const QuoteRecord& q);
json::object toJson(const ChainLegRecord& c);
json::object toJson(const OrderRecord& o);
json::object toJson(const FillRecord& f);
json::object toJson(const LedgerChangeRecord& l);

AuditStamp stampFromJson(const json::object& o);
QuoteRecord quoteFromJson(const json::object& o);
ChainLegRecord chainLegFromJson(const json::object& o);
OrderRecord orderFromJson(const json::object& o);
FillRecord fillFromJson(const json::object& o);
LedgerChangeRecord ledgerChangeFromJson(const json::object& o);

}

#include "sentinel/capital/AllocationTypes.hpp"

#include <stdexcept>

namespace sentinel::capital {

using infra::intOr;
using infra::numberOr;
using infra::stringOr;

const char* toString(AllocationStatus s) {
    switch (s) {
        case AllocationStatus::STAGED: return "staged";
        case AllocationStatus::ACTIVE: return "active";
        case AllocationStatus::EXPIRED: return "expired";
        case AllocationStatus::FROZEN: return "frozen";
    }
    return "unknown";
}

std::optional<AllocationStatus> parseStatus(const std::string& s) {
    if (s == "staged") return AllocationStatus::STAGED;
    if (s == "active") return AllocationStatus::ACTIVE;
    if (s == "expired") return AllocationStatus::EXPIRED;
    if (s == "frozen") return AllocationStatus::FROZEN;
    return std::nullopt;
}

std::string PrecheckResult::reason() const {
    std::string out;
    for (const PrecheckFailure& f : failures) {
        if (!out.empty()) out += "; ";
        out += f.message;
    }
    return out;
}

const char* toString(StageCode c) {
    switch (c) {
        case StageCode::STAGED: return "STAGED";
        case StageCode::REPLAYED: return "REPLAYED";
        case StageCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case StageCode::FROZEN: return "FROZEN";
        case StageCode::PRECHECK_FAILED: return "PRECHECK_FAILED";
        case StageCode::COMPLIANCE_FAILED: return "COMPLIANCE_FAILED";
        case StageCode::STALE_MARKET_DATA: return "STALE_MARKET_DATA";
        case StageCode::STORE_ERROR: return "STORE_ERROR";
    }
    return "UNKNOWN";
}

const char* toString(RebalanceStatus s) {
    switch (s) {
        case RebalanceStatus::APPLIED: return "APPLIED";
        case RebalanceStatus::PREVIEW: return "PREVIEW";
        case RebalanceStatus::REPLAYED: return "REPLAYED";
        case RebalanceStatus::LOCKED: return "LOCKED";
        case RebalanceStatus::FROZEN: return "FROZEN";
        case RebalanceStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<RebalanceStatus> parseRebalanceStatus(const std::string& s) {
    if (s == "APPLIED") return RebalanceStatus::APPLIED;
    if (s == "PREVIEW") return RebalanceStatus::PREVIEW;
    if (s == "REPLAYED") return RebalanceStatus::REPLAYED;
    if (s == "LOCKED") return RebalanceStatus::LOCKED;
    if (s == "FROZEN") return RebalanceStatus::FROZEN;
    if (s == "FAILED") return RebalanceStatus::FAILED;
    return std::nullopt;
}

// --- json ---

json::object toJson(const Allocation& a) {
    json::object o;
    o["id"] = a.id;
    o["session_id"] = a.session_id;
    o["strategy_ref"] = a.strategy_ref;
    o["pool"] = a.pool;
    o["allocation"] = a.allocation;
    o["status"] = toString(a.status);
    o["ttl_until"] = a.ttl_until;
    o["consistency_token"] = a.consistency_token;
    o["created_at"] = a.created_at;
    o["activated_at"] = a.activated_at;
    o["seq"] = a.seq;
    o["status_reason"] = a.status_reason;
    return o;
}

Allocation allocationFromJson(const json::object& o) {
    Allocation a;
    a.id = stringOr(o, "id", "");
    a.session_id = stringOr(o, "session_id", "");
    a.strategy_ref = stringOr(o, "strategy_ref", "");
    a.pool = stringOr(o, "pool", "evo");
    a.allocation = numberOr(o, "allocation", 0.0);

    std::string status = stringOr(o, "status", "");
    std::optional<AllocationStatus> parsed = parseStatus(status);
    if (!parsed) {
        throw std::invalid_argument("allocation " + a.id + " has unknown status '" + status + "'");
    }
    a.status = *parsed;

    a.ttl_until = intOr(o, "ttl_until", 0);
    a.consistency_token = stringOr(o, "consistency_token", "");
    a.created_at = intOr(o, "created_at", 0);
    a.activated_at = intOr(o, "activated_at", 0);
    a.seq = static_cast<uint64_t>(intOr(o, "seq", 0));
    a.status_reason = stringOr(o, "status_reason", "");
    return a;
}

static json::array changesToJson(const std::vector<AllocationChange>& v) {
    json::array arr;
    for (const AllocationChange& c : v) {
        json::object o;
        o["id"] = c.id;
        o["strategy_ref"] = c.strategy_ref;
        o["allocation"] = c.allocation;
        o["reason"] = c.reason;
        arr.emplace_back(std::move(o));
    }
    return arr;
}

static std::vector<AllocationChange> changesFromJson(
    const json::object& o,
    const char* key
) {
    std::vector<AllocationChange> out;
    const json::value* v = o.if_contains(key);
    if (!v || !v->is_array()) return out;
    for (const json::value& item : v->get_array()) {
        const json::object& c = infra::requireObject(item, key);
        AllocationChange ch;
        ch.id = stringOr(c, "id", "");
        ch.strategy_ref = stringOr(c, "strategy_ref", "");
        ch.allocation = numberOr(c, "allocation", 0.0);
        ch.reason = stringOr(c, "reason", "");
        out.push_back(std::move(ch));
    }
    return out;
}

json::object toJson(const RebalanceResult& r) {
    json::object o;
    o["status"] = toString(r.status);
    o["bucket"] = r.bucket;
    o["consistency_token"] = r.consistency_token;
    o["at"] = r.at;
    o["pool_cap"] = r.pool_cap;
    o["total_before"] = r.total_before;
    o["total_after"] = r.total_after;
    o["activated"] = changesToJson(r.activated);
    o["rejected"] = changesToJson(r.rejected);
    o["expired"] = changesToJson(r.expired);
    o["message"] = r.message;
    return o;
}

RebalanceResult rebalanceResultFromJson(const json::object& o) {
    RebalanceResult r;
    r.status = parseRebalanceStatus(stringOr(o, "status", "")).value_or(RebalanceStatus::APPLIED);
    r.bucket = stringOr(o, "bucket", "");
    r.consistency_token = stringOr(o, "consistency_token", "");
    r.at = intOr(o, "at", 0);
    r.pool_cap = numberOr(o, "pool_cap", 0.0);
    r.total_before = numberOr(o, "total_before", 0.0);
    r.total_after = numberOr(o, "total_after", 0.0);
    r.activated = changesFromJson(o, "activated");
    r.rejected = changesFromJson(o, "rejected");
    r.expired = changesFromJson(o, "expired");
    r.message = stringOr(o, "message", "");
    return r;
}

}

#include "sentinel/audit/AuditRecords.hpp"

namespace sentinel::audit {

using infra::intOr;
using infra::numberOr;
using infra::stringOr;
using infra::boolOr;

double midOf(double bid, double ask) {
    if (bid > 0.0 && ask > 0.0) {
        return (bid + ask) / 2.0;
    }
    return 0.0;
}

json::object toJson(const AuditStamp& s) {
    json::object o;
    o["server_ts"] = s.server_ts;
    o["ts_feed"] = s.ts_feed;
    o["ts_recv"] = s.ts_recv;
    o["commit_hash"] = s.commit_hash;
    o["policy_hash"] = s.policy_hash;
    o["environment"] = s.environment;
    o["worm_mode"] = s.worm_mode;
    return o;
}

json::object toJson(const QuoteRecord& q) {
    json::object o;
    o["symbol"] = q.symbol;
    o["bid"] = q.bid;
    o["ask"] = q.ask;
    o["mid"] = q.mid;
    o["ts_feed"] = q.ts_feed;
    o["ts_recv"] = q.ts_recv;
    o["source"] = q.source;
    return o;
}

json::object toJson(const ChainLegRecord& c) {
    json::object g;
    g["delta"] = c.greeks.delta;
    g["gamma"] = c.greeks.gamma;
    g["theta"] = c.greeks.theta;
    g["vega"] = c.greeks.vega;
    g["rho"] = c.greeks.rho;

    json::object o;
    o["symbol"] = c.symbol;
    o["expiry"] = c.expiry;
    o["strike"] = c.strike;
    o["bid"] = c.bid;
    o["ask"] = c.ask;
    o["oi"] = c.oi;
    o["vol"] = c.vol;
    o["greeks"] = std::move(g);
    o["iv"] = c.iv;
    o["ts_feed"] = c.ts_feed;
    o["ts_recv"] = c.ts_recv;
    o["source"] = c.source;
    return o;
}

json::object toJson(const OrderRecord& r) {
    json::array ladders;
    for (double px : r.ladders) {
        ladders.emplace_back(px);
    }

    json::object o;
    o["plan_id"] = r.plan_id;
    o["route"] = r.route;
    o["ladders"] = std::move(ladders);
    o["planned_max_slip"] = r.planned_max_slip;
    o["ts_created"] = r.ts_created;
    return o;
}

json::object toJson(const FillRecord& f) {
    json::object o;
    o["plan_id"] = f.plan_id;
    o["symbol"] = f.symbol;
    o["side"] = f.side;
    o["price"] = f.price;
    o["qty"] = f.qty;
    o["fees"] = f.fees;
    o["ts_fill"] = f.ts_fill;
    o["broker_attestation"] = f.broker_attestation;
    return o;
}

json::object toJson(const LedgerChangeRecord& l) {
    json::object o;
    o["cash_before"] = l.cash_before;
    o["cash_after"] = l.cash_after;
    o["reason"] = l.reason;
    o["plan_id"] = l.plan_id;
    o["ts_change"] = l.ts_change;
    return o;
}

AuditStamp stampFromJson(const json::object& o) {
    AuditStamp s;
    s.server_ts = intOr(o, "server_ts", 0);
    s.ts_feed = intOr(o, "ts_feed", 0);
    s.ts_recv = intOr(o, "ts_recv", 0);
    s.commit_hash = stringOr(o, "commit_hash", "");
    s.policy_hash = stringOr(o, "policy_hash", "");
    s.environment = stringOr(o, "environment", "");
    s.worm_mode = boolOr(o, "worm_mode", true);
    return s;
}

QuoteRecord quoteFromJson(const json::object& o) {
    QuoteRecord q;
    q.symbol = stringOr(o, "symbol", "");
    q.bid = numberOr(o, "bid", 0.0);
    q.ask = numberOr(o, "ask", 0.0);
    q.mid = numberOr(o, "mid", midOf(q.bid, q.ask));
    q.ts_feed = intOr(o, "ts_feed", 0);
    q.ts_recv = intOr(o, "ts_recv", 0);
    q.source = stringOr(o, "source", "feed");
    return q;
}

ChainLegRecord chainLegFromJson(const json::object& o) {
    ChainLegRecord c;
    c.symbol = stringOr(o, "symbol", "");
    c.expiry = stringOr(o, "expiry", "");
    c.strike = numberOr(o, "strike", 0.0);
    c.bid = numberOr(o, "bid", 0.0);
    c.ask = numberOr(o, "ask", 0.0);
    c.oi = intOr(o, "oi", 0);
    c.vol = intOr(o, "vol", 0);
    if (const json::object* g = infra::objectAt(o, "greeks")) {
        c.greeks.delta = numberOr(*g, "delta", 0.0);
        c.greeks.gamma = numberOr(*g, "gamma", 0.0);
        c.greeks.theta = numberOr(*g, "theta", 0.0);
        c.greeks.vega = numberOr(*g, "vega", 0.0);
        c.greeks.rho = numberOr(*g, "rho", 0.0);
    }
    c.iv = numberOr(o, "iv", 0.0);
    c.ts_feed = intOr(o, "ts_feed", 0);
    c.ts_recv = intOr(o, "ts_recv", 0);
    c.source = stringOr(o, "source", "feed");
    return c;
}

OrderRecord orderFromJson(const json::object& o) {
    OrderRecord r;
    r.plan_id = stringOr(o, "plan_id", "");
    r.route = stringOr(o, "route", "");
    if (const json::value* v = o.if_contains("ladders")) {
        if (v->is_array()) {
            for (const json::value& px : v->get_array()) {
                r.ladders.push_back(infra::toDouble(px, "ladders"));
            }
        }
    }
    r.planned_max_slip = numberOr(o, "planned_max_slip", 0.0);
    r.ts_created = intOr(o, "ts_created", 0);
    return r;
}

FillRecord fillFromJson(const json::object& o) {
    FillRecord f;
    f.plan_id = stringOr(o, "plan_id", "");
    f.symbol = stringOr(o, "symbol", "");
    f.side = stringOr(o, "side", "");
    f.price = numberOr(o, "price", 0.0);
    f.qty = numberOr(o, "qty", 0.0);
    f.fees = numberOr(o, "fees", 0.0);
    f.ts_fill = intOr(o, "ts_fill", 0);
    f.broker_attestation = stringOr(o, "broker_attestation", "");
    return f;
}

LedgerChangeRecord ledgerChangeFromJson(const json::object& o) {
    LedgerChangeRecord l;
    l.cash_before = numberOr(o, "cash_before", 0.0);
    l.cash_after = numberOr(o, "cash_after", 0.0);
    l.reason = stringOr(o, "reason", "");
    l.plan_id = stringOr(o, "plan_id", "");
    l.ts_change = intOr(o, "ts_change", 0);
    return l;
}

}

#include "sentinel/runtime/ReplayFeed.hpp"

#include "sentinel/core/Errors.hpp"
#include "sentinel/infra/Json.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace sentinel::runtime {

namespace json = boost::json;

using infra::intOr;
using infra::numberOr;
using infra::objectAt;
using infra::stringOr;

const char* toString(FeedEventType t) {
    switch (t) {
        case FeedEventType::QUOTE: return "quote";
        case FeedEventType::CHAIN: return "chain";
        case FeedEventType::SIGNAL: return "signal";
        case FeedEventType::STATS: return "stats";
        case FeedEventType::STAGE: return "stage";
        case FeedEventType::HEARTBEAT: return "heartbeat";
        case FeedEventType::CYCLE: return "cycle";
        case FeedEventType::REBALANCE: return "rebalance";
        case FeedEventType::PRODUCTION: return "production";
        case FeedEventType::GREEKS: return "greeks";
        case FeedEventType::KILL: return "kill";
    }
    return "unknown";
}

namespace {

Greeks greeksFrom(const json::object& o) {
    Greeks g;
    g.delta = numberOr(o, "delta", 0.0);
    g.gamma = numberOr(o, "gamma", 0.0);
    g.theta = numberOr(o, "theta", 0.0);
    g.vega = numberOr(o, "vega", 0.0);
    g.rho = numberOr(o, "rho", 0.0);
    return g;
}

coordination::TradingSignal signalFrom(const json::object& o) {
    coordination::TradingSignal s;
    s.symbol = stringOr(o, "symbol", "");
    std::string side = stringOr(o, "side", "buy");
    auto parsed = coordination::parseSide(side);
    if (!parsed) {
        throw std::invalid_argument("signal side '" + side + "' is not buy or sell");
    }
    s.side = *parsed;
    s.strategy_id = stringOr(o, "strategy_id", "");
    s.confidence = numberOr(o, "confidence", s.confidence);
    s.price = numberOr(o, "price", s.price);
    s.spread_bps = numberOr(o, "spread_bps", s.spread_bps);
    s.costs_est = numberOr(o, "costs_est", s.costs_est);
    s.quantity = numberOr(o, "quantity", s.quantity);
    return s;
}

capital::StageRequest stageFrom(const json::object& o) {
    capital::StageRequest r;
    r.session_id = stringOr(o, "session_id", "");
    r.strategy_ref = stringOr(o, "strategy_ref", "");
    r.allocation = numberOr(o, "allocation", 0.0);
    r.pool = stringOr(o, "pool", r.pool);
    r.ttl_days = numberOr(o, "ttl_days", r.ttl_days);
    r.consistency_token = stringOr(o, "consistency_token", "");
    r.reference_symbol = stringOr(o, "reference_symbol", "");
    if (const json::object* p = objectAt(o, "performance")) {
        capital::StrategyPerformance& perf = r.performance;
        perf.sharpe = numberOr(*p, "sharpe", perf.sharpe);
        perf.max_drawdown = numberOr(*p, "max_drawdown", perf.max_drawdown);
        perf.win_rate = numberOr(*p, "win_rate", perf.win_rate);
        perf.trade_count = intOr(*p, "trade_count", perf.trade_count);
        perf.avg_slippage_bps = numberOr(*p, "avg_slippage_bps", perf.avg_slippage_bps);
        perf.trace_completeness = numberOr(*p, "trace_completeness", perf.trace_completeness);
    }
    return r;
}

}

FeedEvent parseFeedEvent(const std::string& line) {
    json::value v;
    try {
        v = json::parse(line);
    } catch (const std::exception& e) {
        throw std::invalid_argument(std::string("bad json: ") + e.what());
    }
    const json::object& o = infra::requireObject(v, "feed event");
    std::string type = stringOr(o, "type", "");

    FeedEvent ev;
    if (type == "quote") {
        ev.type = FeedEventType::QUOTE;
        ev.quote = audit::quoteFromJson(o);
        if (ev.quote.symbol.empty()) {
            throw std::invalid_argument("quote without symbol");
        }
    } else if (type == "chain") {
        ev.type = FeedEventType::CHAIN;
        ev.chain_leg = audit::chainLegFromJson(o);
    } else if (type == "signal") {
        ev.type = FeedEventType::SIGNAL;
        ev.signal = signalFrom(o);
    } else if (type == "stats") {
        ev.type = FeedEventType::STATS;
        ev.strategy_id = stringOr(o, "strategy_id", "");
        if (ev.strategy_id.empty()) {
            throw std::invalid_argument("stats without strategy_id");
        }
        // producers send either key spelling
        ev.stats.profit_factor = numberOr(
            o, "profit_factor", numberOr(o, "pf_after_costs", ev.stats.profit_factor));
        ev.stats.trades_count = intOr(
            o, "trades_count", intOr(o, "trades", ev.stats.trades_count));
        ev.stats.win_rate = numberOr(o, "win_rate", ev.stats.win_rate);
        ev.stats.avg_win = numberOr(o, "avg_win", ev.stats.avg_win);
        ev.stats.avg_loss = numberOr(o, "avg_loss", ev.stats.avg_loss);
    } else if (type == "stage") {
        ev.type = FeedEventType::STAGE;
        ev.stage = stageFrom(o);
    } else if (type == "heartbeat") {
        ev.type = FeedEventType::HEARTBEAT;
    } else if (type == "cycle") {
        ev.type = FeedEventType::CYCLE;
    } else if (type == "rebalance") {
        ev.type = FeedEventType::REBALANCE;
        ev.consistency_token = stringOr(o, "consistency_token", "");
        ev.preview = stringOr(o, "mode", "execute") == "preview";
    } else if (type == "production") {
        ev.type = FeedEventType::PRODUCTION;
        ev.production.sharpe_20d = numberOr(o, "sharpe_20d", ev.production.sharpe_20d);
        ev.production.drawdown = numberOr(o, "drawdown", ev.production.drawdown);
    } else if (type == "greeks") {
        ev.type = FeedEventType::GREEKS;
        ev.greeks = greeksFrom(o);
    } else if (type == "kill") {
        ev.type = FeedEventType::KILL;
        ev.reason = stringOr(o, "reason", "manual kill switch");
    } else {
        throw std::invalid_argument("unknown event type '" + type + "'");
    }
    return ev;
}

ReplayFeed::ReplayFeed(std::string path) : file(std::move(path)) {}

std::vector<FeedEvent> ReplayFeed::load() {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("cannot open replay file " + file);
    }

    std::vector<FeedEvent> events;
    std::string line;
    size_t n = 0;
    bad_lines = 0;
    while (std::getline(in, line)) {
        ++n;
        if (line.empty() || line[0] == '#') continue;
        try {
            events.push_back(parseFeedEvent(line));
        } catch (const std::invalid_argument& e) {
            ++bad_lines;
            std::cerr << "[REPLAY] " << file << ":" << n << " skipped: " << e.what() << std::endl;
        }
    }
    std::cout << "[REPLAY] loaded " << events.size() << " events from " << file
              << " (" << bad_lines << " skipped)" << std::endl;
    return events;
}

}

#include "sentinel/config/PipelineConfig.hpp"

#include "sentinel/config/Env.hpp"
#include "sentinel/core/Errors.hpp"
#include "sentinel/infra/Sha256.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sentinel::config {

using infra::boolOr;
using infra::intOr;
using infra::numberOr;
using infra::objectAt;
using infra::stringOr;
using infra::stringsOr;

namespace {

void requirePositive(double v, const char* key) {
    if (!std::isfinite(v) || v <= 0.0) {
        throw ConfigError(std::string(key) + " must be positive");
    }
}

void requireFraction(double v, const char* key) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigError(std::string(key) + " must be within [0,1]");
    }
}

void parseGate(const json::object& o, gate::GateLimits& g) {
    g.quote_stale_sec = numberOr(o, "quote_stale_sec", g.quote_stale_sec);
    g.broker_stale_sec = numberOr(o, "broker_stale_sec", g.broker_stale_sec);
    g.max_portfolio_heat = numberOr(o, "max_portfolio_heat", g.max_portfolio_heat);
    g.max_strategy_heat = numberOr(o, "max_strategy_heat", g.max_strategy_heat);

    requirePositive(g.quote_stale_sec, "gate.quote_stale_sec");
    requirePositive(g.broker_stale_sec, "gate.broker_stale_sec");
    requireFraction(g.max_portfolio_heat, "gate.max_portfolio_heat");
    requireFraction(g.max_strategy_heat, "gate.max_strategy_heat");
}

void parseProver(const json::object& o, proof::ProverLimits& p) {
    p.max_slippage_multiplier = numberOr(o, "max_slippage_multiplier", p.max_slippage_multiplier);
    p.min_fill_pct = numberOr(o, "min_fill_pct", p.min_fill_pct);
    p.net_debit_tolerance = numberOr(o, "net_debit_tolerance", p.net_debit_tolerance);
    p.cost_tolerance_pct = numberOr(o, "cost_tolerance_pct", p.cost_tolerance_pct);
    p.greeks_drift_max = numberOr(o, "greeks_drift_max", p.greeks_drift_max);
    p.headroom_buffer = numberOr(o, "headroom_buffer", p.headroom_buffer);
    p.nbbo_tolerance_ms = intOr(o, "nbbo_tolerance_ms", p.nbbo_tolerance_ms);
    p.leveraged_etf_bonus = numberOr(o, "leveraged_etf_bonus", p.leveraged_etf_bonus);
    p.leveraged_etf_symbols = stringsOr(o, "leveraged_etf_symbols", p.leveraged_etf_symbols);
    p.require_nbbo = boolOr(o, "require_nbbo", p.require_nbbo);

    requirePositive(p.max_slippage_multiplier, "prover.max_slippage_multiplier");
    requireFraction(p.min_fill_pct, "prover.min_fill_pct");
    requireFraction(p.headroom_buffer, "prover.headroom_buffer");
    if (p.nbbo_tolerance_ms < 0) {
        throw ConfigError("prover.nbbo_tolerance_ms must not be negative");
    }
}

void parseCompliance(const json::object& o, temporal::ComplianceThresholds& c) {
    c.nbbo_freshness = numberOr(o, "nbbo_freshness", c.nbbo_freshness);
    c.friction_20 = numberOr(o, "friction_20", c.friction_20);
    c.friction_25 = numberOr(o, "friction_25", c.friction_25);
    c.cap_violations = static_cast<uint64_t>(intOr(o, "cap_violations", static_cast<int64_t>(c.cap_violations)));
    c.slippage_conformance = numberOr(o, "slippage_conformance", c.slippage_conformance);
    c.proof_pass_rate = numberOr(o, "proof_pass_rate", c.proof_pass_rate);
    c.fresh_quote_ms = intOr(o, "fresh_quote_ms", c.fresh_quote_ms);
}

void parsePromotion(const json::object& o, capital::PromotionThresholds& p) {
    p.min_sharpe = numberOr(o, "min_sharpe", p.min_sharpe);
    p.max_drawdown = numberOr(o, "max_drawdown", p.max_drawdown);
    p.min_win_rate = numberOr(o, "min_win_rate", p.min_win_rate);
    p.min_trades = intOr(o, "min_trades", p.min_trades);
    p.max_avg_slippage_bps = numberOr(o, "max_avg_slippage_bps", p.max_avg_slippage_bps);
    p.min_trace_completeness = numberOr(o, "min_trace_completeness", p.min_trace_completeness);
}

void parsePoolCap(const json::object& o, capital::PoolCapParams& p) {
    p.base = numberOr(o, "base", p.base);
    p.sharpe_bonus = numberOr(o, "sharpe_bonus", p.sharpe_bonus);
    p.sharpe_threshold = numberOr(o, "sharpe_threshold", p.sharpe_threshold);
    p.drawdown_multiplier = numberOr(o, "drawdown_multiplier", p.drawdown_multiplier);
    p.penalty_cap = numberOr(o, "penalty_cap", p.penalty_cap);
    p.min_cap = numberOr(o, "min_cap", p.min_cap);
    p.max_cap = numberOr(o, "max_cap", p.max_cap);

    requireFraction(p.min_cap, "pool_cap.min_cap");
    requireFraction(p.max_cap, "pool_cap.max_cap");
    if (p.min_cap > p.max_cap) {
        throw ConfigError("pool_cap.min_cap exceeds pool_cap.max_cap");
    }
}

void parseAllocator(const json::object& o, capital::AllocatorOptions& a) {
    a.state_file = stringOr(o, "state_file", a.state_file);
    a.nbbo_max_age_ms = intOr(o, "nbbo_max_age_ms", a.nbbo_max_age_ms);
    a.lock_stale_ms = intOr(o, "lock_stale_ms", a.lock_stale_ms);
    a.cap_tolerance = numberOr(o, "cap_tolerance", a.cap_tolerance);
    a.default_equity = numberOr(o, "default_equity", a.default_equity);
    requirePositive(a.default_equity, "allocator.default_equity");
}

void parseAudit(const json::object& o, audit::AuditOptions& a) {
    a.journal_file = stringOr(o, "journal_file", a.journal_file);
    a.write_timeout_ms = intOr(o, "write_timeout_ms", a.write_timeout_ms);
    a.read_timeout_ms = intOr(o, "read_timeout_ms", a.read_timeout_ms);
    if (a.journal_file.empty()) {
        throw ConfigError("audit.journal_file must not be empty");
    }
}

void parseScheduler(const json::object& o, SchedulerOptions& s) {
    s.cycle_ms = intOr(o, "cycle_ms", s.cycle_ms);
    s.rebalance_ms = intOr(o, "rebalance_ms", s.rebalance_ms);
    s.staleness_ms = intOr(o, "staleness_ms", s.staleness_ms);
    if (s.cycle_ms <= 0 || s.rebalance_ms <= 0 || s.staleness_ms <= 0) {
        throw ConfigError("scheduler periods must be positive");
    }
}

void parseExecution(const json::object& o, ExecutionOptions& e) {
    e.route = stringOr(o, "route", e.route);
    e.option_type = stringOr(o, "option_type", e.option_type);
    e.max_slippage = numberOr(o, "max_slippage", e.max_slippage);
    e.fee_per_unit = numberOr(o, "fee_per_unit", e.fee_per_unit);
    e.starting_cash = numberOr(o, "starting_cash", e.starting_cash);
    e.quote_max_age_ms = intOr(o, "quote_max_age_ms", e.quote_max_age_ms);

    if (!std::isfinite(e.max_slippage) || e.max_slippage < 0.0) {
        throw ConfigError("execution.max_slippage must not be negative");
    }
    if (!std::isfinite(e.fee_per_unit) || e.fee_per_unit < 0.0) {
        throw ConfigError("execution.fee_per_unit must not be negative");
    }
    requirePositive(e.starting_cash, "execution.starting_cash");
    if (e.quote_max_age_ms <= 0) {
        throw ConfigError("execution.quote_max_age_ms must be positive");
    }
}

}

PipelineConfig parsePipelineConfig(const json::object& root) {
    PipelineConfig cfg;
    try {
        if (const json::object* o = objectAt(root, "runtime")) {
            cfg.runtime.environment = stringOr(*o, "environment", cfg.runtime.environment);
            cfg.runtime.commit_hash = stringOr(*o, "commit_hash", cfg.runtime.commit_hash);
            cfg.runtime.data_dir = stringOr(*o, "data_dir", cfg.runtime.data_dir);
            cfg.runtime.worm_mode = boolOr(*o, "worm_mode", cfg.runtime.worm_mode);
        }
        if (const json::object* o = objectAt(root, "coordinator")) {
            int64_t n = intOr(*o, "max_contenders", static_cast<int64_t>(cfg.coordinator.max_contenders));
            if (n < 0) throw ConfigError("coordinator.max_contenders must not be negative");
            cfg.coordinator.max_contenders = static_cast<size_t>(n);
        }
        if (const json::object* o = objectAt(root, "gate")) parseGate(*o, cfg.gate);
        if (const json::object* o = objectAt(root, "prover")) parseProver(*o, cfg.prover);
        if (const json::object* o = objectAt(root, "compliance")) parseCompliance(*o, cfg.compliance);
        if (const json::object* o = objectAt(root, "promotion")) parsePromotion(*o, cfg.promotion);
        if (const json::object* o = objectAt(root, "pool_cap")) parsePoolCap(*o, cfg.pool_cap);
        if (const json::object* o = objectAt(root, "allocator")) parseAllocator(*o, cfg.allocator);
        if (const json::object* o = objectAt(root, "audit")) parseAudit(*o, cfg.audit);
        if (const json::object* o = objectAt(root, "scheduler")) parseScheduler(*o, cfg.scheduler);
        if (const json::object* o = objectAt(root, "execution")) parseExecution(*o, cfg.execution);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return cfg;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    json::value root;
    try {
        root = json::parse(ss.str());
    } catch (const std::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError(path + ": top level must be an object");
    }

    PipelineConfig cfg = parsePipelineConfig(root.get_object());
    std::cout << "[CONFIG] loaded " << path << std::endl;
    return cfg;
}

void applyEnvironment(PipelineConfig& cfg) {
    cfg.runtime.environment = Env::getOr("SENTINEL_ENV", cfg.runtime.environment);
    cfg.runtime.commit_hash = Env::getOr("SENTINEL_COMMIT_HASH", cfg.runtime.commit_hash);
    cfg.runtime.data_dir = Env::getOr("SENTINEL_DATA_DIR", cfg.runtime.data_dir);
}

json::object safetyPolicyJson(const PipelineConfig& cfg) {
    json::object gate;
    gate["quote_stale_sec"] = cfg.gate.quote_stale_sec;
    gate["broker_stale_sec"] = cfg.gate.broker_stale_sec;
    gate["max_portfolio_heat"] = cfg.gate.max_portfolio_heat;
    gate["max_strategy_heat"] = cfg.gate.max_strategy_heat;

    json::object prover;
    prover["max_slippage_multiplier"] = cfg.prover.max_slippage_multiplier;
    prover["min_fill_pct"] = cfg.prover.min_fill_pct;
    prover["net_debit_tolerance"] = cfg.prover.net_debit_tolerance;
    prover["cost_tolerance_pct"] = cfg.prover.cost_tolerance_pct;
    prover["greeks_drift_max"] = cfg.prover.greeks_drift_max;
    prover["headroom_buffer"] = cfg.prover.headroom_buffer;
    prover["nbbo_tolerance_ms"] = cfg.prover.nbbo_tolerance_ms;
    prover["leveraged_etf_bonus"] = cfg.prover.leveraged_etf_bonus;
    prover["leveraged_etf_symbols"] = infra::toJson(cfg.prover.leveraged_etf_symbols);
    prover["require_nbbo"] = cfg.prover.require_nbbo;

    json::object promotion;
    promotion["min_sharpe"] = cfg.promotion.min_sharpe;
    promotion["max_drawdown"] = cfg.promotion.max_drawdown;
    promotion["min_win_rate"] = cfg.promotion.min_win_rate;
    promotion["min_trades"] = cfg.promotion.min_trades;
    promotion["max_avg_slippage_bps"] = cfg.promotion.max_avg_slippage_bps;
    promotion["min_trace_completeness"] = cfg.promotion.min_trace_completeness;

    json::object pool;
    pool["base"] = cfg.pool_cap.base;
    pool["sharpe_bonus"] = cfg.pool_cap.sharpe_bonus;
    pool["sharpe_threshold"] = cfg.pool_cap.sharpe_threshold;
    pool["drawdown_multiplier"] = cfg.pool_cap.drawdown_multiplier;
    pool["penalty_cap"] = cfg.pool_cap.penalty_cap;
    pool["min_cap"] = cfg.pool_cap.min_cap;
    pool["max_cap"] = cfg.pool_cap.max_cap;

    json::object policy;
    policy["gate"] = std::move(gate);
    policy["prover"] = std::move(prover);
    policy["promotion"] = std::move(promotion);
    policy["pool_cap"] = std::move(pool);
    policy["nbbo_max_age_ms"] = cfg.allocator.nbbo_max_age_ms;
    policy["max_slippage"] = cfg.execution.max_slippage;
    return policy;
}

std::string policyHash(const PipelineConfig& cfg) {
    return infra::sha256Hex(json::serialize(safetyPolicyJson(cfg)));
}

std::string dataPath(const PipelineConfig& cfg, const std::string& file) {
    if (file.empty() || file.front() == '/' || cfg.runtime.data_dir.empty()) {
        return file;
    }
    std::string dir = cfg.runtime.data_dir;
    if (dir.back() != '/') dir += '/';
    return dir + file;
}

}

#pragma once

#include <string>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/capital/CapitalAllocator.hpp"
#include "sentinel/capital/PromotionPrecheck.hpp"
#include "sentinel/coordination/DecisionCoordinator.hpp"
#include "sentinel/gate/PreTradeGate.hpp"
#include "sentinel/infra/Json.hpp"
#include "sentinel/proof/PostTradeProver.hpp"
#include "sentinel/temporal/TemporalSummarizer.hpp"

namespace sentinel::config {

namespace json = boost::json;

struct RuntimeOptions {
    std::string environment = "paper";
    std::string commit_hash = "unknown";
    std::string data_dir = "./data";
    bool worm_mode = true;
};

struct SchedulerOptions {
    int64_t cycle_ms = 1000;
    int64_t rebalance_ms = 60 * 60 * 1000;
    int64_t staleness_ms = 5000;
};

// Paper execution and the promise attached to each routed order.
struct ExecutionOptions {
    std::string route = "paper_mid";
    std::string option_type = "equity";
    double max_slippage = 0.06;
    double fee_per_unit = 0.0;
    double starting_cash = 100000.0;
    int64_t quote_max_age_ms = 10 * 1000;
};

struct PipelineConfig {
    RuntimeOptions runtime;
    coordination::CoordinatorOptions coordinator;
    gate::GateLimits gate;
    proof::ProverLimits prover;
    temporal::ComplianceThresholds compliance;
    capital::PromotionThresholds promotion;
    capital::PoolCapParams pool_cap;
    capital::AllocatorOptions allocator;
    audit::AuditOptions audit;
    SchedulerOptions scheduler;
    ExecutionOptions execution;
};

// Every key is optional. Throws ConfigError on unreadable files,
// bad JSON or out-of-range values.
PipelineConfig loadPipelineConfig(const std::string& path);
PipelineConfig parsePipelineConfig(const json::object& root);

// SENTINEL_ENV, SENTINEL_COMMIT_HASH, SENTINEL_DATA_DIR
void applyEnvironment(PipelineConfig& cfg);

// Canonical JSON of the sections that decide what is safe to trade.
json::object safetyPolicyJson(const PipelineConfig& cfg);

// SHA-256 of safetyPolicyJson, stamped on every audit record.
std::string policyHash(const PipelineConfig& cfg);

// data_dir/file unless file is absolute.
std::string dataPath(const PipelineConfig& cfg, const std::string& file);

}

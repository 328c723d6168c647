#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sentinel/audit/AuditStore.hpp"
#include "sentinel/temporal/ProofLedger.hpp"

namespace sentinel::temporal {

struct ComplianceThresholds {
    double nbbo_freshness = 0.95;
    double friction_20 = 0.90;
    double friction_25 = 1.0;
    uint64_t cap_violations = 0;
    double slippage_conformance = 0.95;
    double proof_pass_rate = 0.95;
    int64_t fresh_quote_ms = 5000;
};

// "1h", "24h", "7d"
std::optional<int64_t> windowPresetMs(const std::string& name);

struct SectionResult {
    bool passed = true;
    std::vector<std::string> reasons;
    uint64_t samples = 0;
    double ratio = 1.0;
};

struct NbboSection : SectionResult {
    uint64_t fresh = 0;
};

struct FrictionSection : SectionResult {
    double avg_friction = 0.0;
    uint64_t friction_20_count = 0;
    uint64_t friction_25_count = 0;
    double friction_20_ratio = 1.0;
    double friction_25_ratio = 1.0;
};

struct CapsSection : SectionResult {
    uint64_t violations = 0;
};

struct SlippageSection : SectionResult {
    uint64_t conforming = 0;
    uint64_t using_fallback = 0;
};

struct RouteStats {
    uint64_t total = 0;
    uint64_t passed = 0;
    double pass_rate = 1.0;
};

struct ProofsSection : SectionResult {
    uint64_t passed_count = 0;
    std::map<std::string, RouteStats> by_route;
};

struct TemporalSummary {
    TimestampMs window_start = 0;
    TimestampMs window_end = 0;
    TimestampMs generated_at = 0;

    NbboSection nbbo;
    FrictionSection friction;
    CapsSection caps;
    SlippageSection slippage;
    ProofsSection proofs;

    bool passed = true;
    std::vector<std::string> reasons;
};

// Pure reduction over recorded facts for a half-open window
// [start, end). Same inputs give the same summary.
class TemporalSummarizer {
public:
    TemporalSummarizer(
        const audit::AuditStore& store,
        const ProofLedger& ledger,
        ComplianceThresholds thresholds = ComplianceThresholds(),
        infra::WallClock clock = infra::systemClock()
    );

    TemporalSummary summarize(
        TimestampMs start,
        TimestampMs end
    ) const;

    // Trailing window ending now. Throws std::invalid_argument on an
    // unknown preset.
    TemporalSummary summarizeTrailing(const std::string& preset) const;

    const ComplianceThresholds& thresholds() const { return th; }

private:
    NbboSection proveNbboFreshness(TimestampMs start, TimestampMs end) const;
    FrictionSection proveFrictionCompliance(TimestampMs start, TimestampMs end) const;
    CapsSection proveCapCompliance(TimestampMs start, TimestampMs end) const;
    SlippageSection proveSlippageConformance(const std::vector<ProofOutcome>& outcomes) const;
    ProofsSection proveProofPassRate(const std::vector<ProofOutcome>& outcomes) const;

    const audit::AuditStore& store;
    const ProofLedger& ledger;
    ComplianceThresholds th;
    infra::WallClock clock;
};

std::string formatTemporalSummary(const TemporalSummary& s);

}

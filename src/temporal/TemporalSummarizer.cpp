#include "sentinel/temporal/TemporalSummarizer.hpp"

#include "sentinel/core/Errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sentinel::temporal {

namespace {

std::string pct(double ratio) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return os.str();
}

double ratioOf(uint64_t num, uint64_t den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 1.0;
}

void belowThreshold(
    SectionResult& r,
    const char* code,
    double value,
    double threshold
) {
    if (value < threshold) {
        r.passed = false;
        r.reasons.push_back(
            std::string(code) + ": " + pct(value) + " < " + pct(threshold)
        );
    }
}

}

std::optional<int64_t> windowPresetMs(const std::string& name) {
    if (name == "1h") return infra::MS_PER_HOUR;
    if (name == "24h") return infra::MS_PER_DAY;
    if (name == "7d") return 7 * infra::MS_PER_DAY;
    return std::nullopt;
}

TemporalSummarizer::TemporalSummarizer(
    const audit::AuditStore& store,
    const ProofLedger& ledger,
    ComplianceThresholds thresholds,
    infra::WallClock clock
) : store(store),
    ledger(ledger),
    th(thresholds),
    clock(std::move(clock)) {}

TemporalSummary TemporalSummarizer::summarizeTrailing(const std::string& preset) const {
    std::optional<int64_t> len = windowPresetMs(preset);
    if (!len) {
        throw std::invalid_argument("unknown window preset '" + preset + "'");
    }
    TimestampMs end = clock() + 1;
    return summarize(end - *len, end);
}

TemporalSummary TemporalSummarizer::summarize(
    TimestampMs start,
    TimestampMs end
) const {
    TemporalSummary s;
    s.window_start = start;
    s.window_end = end;
    s.generated_at = clock();

    std::vector<ProofOutcome> outcomes = ledger.outcomes(start, end);

    s.nbbo = proveNbboFreshness(start, end);
    s.friction = proveFrictionCompliance(start, end);
    s.caps = proveCapCompliance(start, end);
    s.slippage = proveSlippageConformance(outcomes);
    s.proofs = proveProofPassRate(outcomes);

    const SectionResult* parts[] = {
        &s.nbbo, &s.friction, &s.caps, &s.slippage, &s.proofs
    };
    for (const SectionResult* p : parts) {
        if (!p->passed) {
            s.passed = false;
            s.reasons.insert(s.reasons.end(), p->reasons.begin(), p->reasons.end());
        }
    }
    return s;
}

// --- nbbo: share of fills with a recorded quote near the fill ---

NbboSection TemporalSummarizer::proveNbboFreshness(
    TimestampMs start,
    TimestampMs end
) const {
    NbboSection r;
    try {
        std::vector<audit::FillRecord> fills = store.fillsInWindow(start, end);
        r.samples = fills.size();
        for (const audit::FillRecord& f : fills) {
            if (store.nbboAt(f.symbol, f.ts_fill, th.fresh_quote_ms)) {
                ++r.fresh;
            }
        }
        r.ratio = ratioOf(r.fresh, r.samples);
        belowThreshold(r, "NBBO_FRESHNESS_INSUFFICIENT", r.ratio, th.nbbo_freshness);
    } catch (const StoreError& e) {
        std::cerr << "[TEMPORAL] nbbo freshness: " << e.what() << std::endl;
        r.passed = false;
        r.reasons.push_back(std::string("NBBO_FRESHNESS_CALCULATION_ERROR: ") + e.what());
    }
    return r;
}

// --- friction ---

FrictionSection TemporalSummarizer::proveFrictionCompliance(
    TimestampMs start,
    TimestampMs end
) const {
    FrictionSection r;
    try {
        audit::FrictionStats st = store.frictionStats(start, end);
        r.samples = st.total_fills;
        r.avg_friction = st.avg_friction;
        r.friction_20_count = st.friction_20_count;
        r.friction_25_count = st.friction_25_count;
        r.friction_20_ratio = ratioOf(st.friction_20_count, st.total_fills);
        r.friction_25_ratio = ratioOf(st.friction_25_count, st.total_fills);
        r.ratio = r.friction_20_ratio;

        belowThreshold(r, "FRICTION_20PCT_INSUFFICIENT", r.friction_20_ratio, th.friction_20);
        belowThreshold(r, "FRICTION_25PCT_INSUFFICIENT", r.friction_25_ratio, th.friction_25);
    } catch (const StoreError& e) {
        std::cerr << "[TEMPORAL] friction: " << e.what() << std::endl;
        r.passed = false;
        r.reasons.push_back(std::string("FRICTION_CALCULATION_ERROR: ") + e.what());
    }
    return r;
}

// --- caps ---

CapsSection TemporalSummarizer::proveCapCompliance(
    TimestampMs start,
    TimestampMs end
) const {
    CapsSection r;
    std::vector<CapSnapshot> snaps = ledger.caps(start, end);
    r.samples = snaps.size();
    for (const CapSnapshot& c : snaps) {
        if (c.used > c.cap + 1e-9) {
            ++r.violations;
        }
    }
    r.ratio = r.samples > 0
        ? 1.0 - static_cast<double>(r.violations) / static_cast<double>(r.samples)
        : 1.0;

    if (r.violations > th.cap_violations) {
        r.passed = false;
        r.reasons.push_back(
            "CAP_VIOLATIONS_DETECTED: " + std::to_string(r.violations) +
            " violations (threshold: " + std::to_string(th.cap_violations) + ")"
        );
    }
    return r;
}

// --- slippage ---

SlippageSection TemporalSummarizer::proveSlippageConformance(
    const std::vector<ProofOutcome>& outcomes
) const {
    SlippageSection r;
    for (const ProofOutcome& o : outcomes) {
        if (!o.promise_ok) continue;
        ++r.samples;
        if (o.slippage_within) ++r.conforming;
        if (o.using_fallback) ++r.using_fallback;
    }
    r.ratio = ratioOf(r.conforming, r.samples);
    belowThreshold(r, "SLIPPAGE_CONFORMANCE_INSUFFICIENT", r.ratio, th.slippage_conformance);
    return r;
}

// --- proofs ---

ProofsSection TemporalSummarizer::proveProofPassRate(
    const std::vector<ProofOutcome>& outcomes
) const {
    ProofsSection r;
    for (const ProofOutcome& o : outcomes) {
        ++r.samples;
        RouteStats& rs = r.by_route[o.route.empty() ? "UNROUTED" : o.route];
        ++rs.total;
        if (o.passed) {
            ++r.passed_count;
            ++rs.passed;
        }
    }
    for (auto& [route, rs] : r.by_route) {
        rs.pass_rate = ratioOf(rs.passed, rs.total);
    }
    r.ratio = ratioOf(r.passed_count, r.samples);
    belowThreshold(r, "PROOF_PASS_RATE_INSUFFICIENT", r.ratio, th.proof_pass_rate);
    return r;
}

std::string formatTemporalSummary(const TemporalSummary& s) {
    std::ostringstream os;
    os << "Temporal Proof: " << (s.passed ? "PASSED" : "FAILED") << "\n";
    os << "Window: " << infra::toIso8601(s.window_start)
       << " to " << infra::toIso8601(s.window_end) << "\n\n";
    os << "NBBO Freshness: " << pct(s.nbbo.ratio)
       << " (" << s.nbbo.fresh << "/" << s.nbbo.samples << ")\n";
    os << "Friction <=20%: " << pct(s.friction.friction_20_ratio)
       << " (" << s.friction.friction_20_count << "/" << s.friction.samples << ")\n";
    os << "Friction <=25%: " << pct(s.friction.friction_25_ratio)
       << " (" << s.friction.friction_25_count << "/" << s.friction.samples << ")\n";
    os << "Cap Violations: " << s.caps.violations << "/" << s.caps.samples << "\n";
    os << "Slippage Conformance: " << pct(s.slippage.ratio)
       << " (" << s.slippage.conforming << "/" << s.slippage.samples << ")\n";
    os << "Proof Pass Rate: " << pct(s.proofs.ratio)
       << " (" << s.proofs.passed_count << "/" << s.proofs.samples << ")\n";
    for (const auto& [route, rs] : s.proofs.by_route) {
        os << "  " << route << ": " << pct(rs.pass_rate)
           << " (" << rs.passed << "/" << rs.total << ")\n";
    }
    if (!s.passed) {
        os << "\nViolations:\n";
        for (const std::string& r : s.reasons) {
            os << "  - " << r << "\n";
        }
    }
    return os.str();
}

}

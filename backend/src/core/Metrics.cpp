#include "core/Metrics.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace ghzbench {

double require_unit_range(const std::string& what, double value) {
    if (!std::isfinite(value) || value < -kRangeTolerance || value > 1.0 + kRangeTolerance) {
        std::ostringstream ss;
        ss << what << " out of range [0,1]: " << value;
        throw std::logic_error(ss.str());
    }
    return value;
}

FidelityMetrics FidelityEstimator::estimate(const std::optional<StateVector>& state, const CountDistribution& counts) {
    FidelityMetrics m;
    if (state) {
        const std::size_t last = state->dimension() - 1;
        m.exact = state->probability(0) + state->probability(last);
    } else {
        m.exact = kFallbackExactFidelity;
        m.exact_fallback = true;
    }

    if (counts.total() == 0) throw std::logic_error("raw fidelity over an empty distribution");
    const std::uint64_t all_one = (counts.num_qubits() >= 64) ? ~std::uint64_t(0)
                                : ((std::uint64_t(1) << counts.num_qubits()) - 1);
    const std::uint64_t hits = counts.count(std::uint64_t(0)) + counts.count(all_one);
    m.raw = static_cast<double>(hits) / static_cast<double>(counts.total());

    require_unit_range("exact fidelity", m.exact);
    require_unit_range("raw fidelity", m.raw);
    return m;
}

CorrectionSummary FidelityEstimator::apply_correction(const FidelityMetrics& metrics,
                                                      const std::optional<CorrectionResult>& correction) {
    CorrectionSummary s;
    s.fidelity_used = metrics.exact;
    if (correction) {
        s.applied = true;
        if (correction->fidelity) s.fidelity_used = *correction->fidelity;
        s.stability = correction->stability;
        s.error_rate = correction->error_rate;
    }
    require_unit_range("fidelity used", s.fidelity_used);
    return s;
}

CorrelationMap CorrelationAnalyzer::analyze(const CountDistribution& counts, const std::vector<NodeGroup>& groups) {
    CorrelationMap out;
    out.reserve(groups.size());
    const double total = static_cast<double>(counts.total());
    for (const auto& g : groups) {
        const std::uint64_t m = g.mask();
        std::uint64_t correlated = 0;
        for (const auto& [idx, c] : counts.counts()) {
            const std::uint64_t bits = idx & m;
            if (bits == 0 || bits == m) correlated += c;
        }
        const double value = total > 0.0 ? static_cast<double>(correlated) / total : 0.0;
        out.emplace_back(g.node, require_unit_range("correlation for " + g.node, value));
    }
    return out;
}

double CorrelationAnalyzer::mean(const CorrelationMap& map) {
    if (map.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& [node, v] : map) sum += v;
    return sum / static_cast<double>(map.size());
}

double CompositeScorer::score(double fidelity_used, const CorrelationMap& correlations) {
    const double value = (fidelity_used + CorrelationAnalyzer::mean(correlations)) / 2.0;
    return require_unit_range("composite index", value);
}

} // namespace ghzbench

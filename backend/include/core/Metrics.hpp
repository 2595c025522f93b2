#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Topology.hpp"
#include "simulator/CountDistribution.hpp"
#include "simulator/StateVector.hpp"

namespace ghzbench {

// Theoretical exact fidelity used when the state simulator fails.
inline constexpr double kFallbackExactFidelity = 0.5;
// Idealized fidelity of the target state, reported as a separate baseline.
inline constexpr double kTheoreticalBaseline = 1.0;
inline constexpr double kDefaultStability = 0.95;
inline constexpr double kDefaultErrorRate = 0.05;
// Tolerance for the [0,1] range checks.
inline constexpr double kRangeTolerance = 1e-9;

struct FidelityMetrics {
    double exact = 0.0;
    double raw = 0.0;
    bool exact_fallback = false;
};

// Result of an external error-correction pass.
struct CorrectionResult {
    std::optional<double> fidelity;   // absent: keep the exact fidelity
    double stability = kDefaultStability;
    double error_rate = kDefaultErrorRate;
};

struct CorrectionSummary {
    bool applied = false;
    double fidelity_used = 0.0;
    double stability = kDefaultStability;
    double error_rate = kDefaultErrorRate;
};

// Node name -> correlated fraction, in grouping order.
using CorrelationMap = std::vector<std::pair<std::string, double>>;

// Throws std::logic_error when value is outside [0,1].
double require_unit_range(const std::string& what, double value);

class FidelityEstimator {
public:
    // state is absent when exact simulation failed.
    static FidelityMetrics estimate(const std::optional<StateVector>& state, const CountDistribution& counts);

    // Folds an optional correction into the fidelity actually used for scoring.
    static CorrectionSummary apply_correction(const FidelityMetrics& metrics,
                                              const std::optional<CorrectionResult>& correction);
};

/**
 * @brief Per-node uniformity of sampled outcomes.
 *
 * Works per distinct outcome rather than per shot: an outcome is
 * correlated for a node when its bits under the node mask are all 0 or
 * all 1, and contributes its whole count at once.
 */
class CorrelationAnalyzer {
public:
    static CorrelationMap analyze(const CountDistribution& counts, const std::vector<NodeGroup>& groups);
    static double mean(const CorrelationMap& map);
};

class CompositeScorer {
public:
    // (fidelity_used + mean correlation) / 2
    static double score(double fidelity_used, const CorrelationMap& correlations);
};

} // namespace ghzbench

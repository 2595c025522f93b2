#include "simulator/Simulator.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <new>
#include <random>
#include <vector>

namespace ghzbench {

namespace {

constexpr double kNormTolerance = 1e-9;

void check_targets(const Gate& g, std::size_t n) {
    const std::size_t expected = (g.kind == GateKind::CNOT) ? 2 : 1;
    if (g.qubits.size() != expected) throw SimulationError(errors::D3100_MALFORMED_GATE);
    for (auto q : g.qubits) {
        if (q >= n) throw SimulationError(errors::D3100_QUBIT_OUT_OF_RANGE);
    }
}

} // namespace

DenseStateSimulator::DenseStateSimulator(std::size_t max_qubits)
: max_qubits_(max_qubits) {}

StateVector DenseStateSimulator::evolve(const Circuit& circuit) {
    const std::size_t n = circuit.num_qubits();
    if (n == 0) throw SimulationError(errors::D3100_REGISTER_EMPTY);
    if (n > max_qubits_) {
        throw SimulationError(std::string(errors::D3100_REGISTER_TOO_LARGE) + " (" +
                              std::to_string(n) + " > " + std::to_string(max_qubits_) + ")");
    }

    try {
        StateVector sv(n);
        for (const auto& g : circuit.gates()) {
            if (g.is_marker()) continue;
            check_targets(g, n);
            switch (g.kind) {
                case GateKind::H:    sv.apply_h(g.qubits[0]); break;
                case GateKind::RY:   sv.apply_ry(g.qubits[0], g.angle); break;
                case GateKind::CNOT: sv.apply_cx(g.qubits[0], g.qubits[1]); break;
                default: break;
            }
        }
        const double norm = sv.norm2();
        if (!std::isfinite(norm) || std::abs(norm - 1.0) > kNormTolerance) {
            throw SimulationError(errors::D3100_NORM_DIVERGED);
        }
        return sv;
    } catch (const std::bad_alloc&) {
        throw SimulationError(errors::D3100_ALLOCATION_FAILED);
    }
}

Simulator::Simulator(std::optional<std::uint64_t> seed, std::shared_ptr<StateSimulator> engine)
: seed_(seed), engine_(std::move(engine)) {
    if (!engine_) engine_ = std::make_shared<DenseStateSimulator>();
}

CountDistribution Simulator::run(const Circuit& measured, std::int64_t shots) {
    if (shots <= 0) throw SimulationError(errors::D3100_SHOTS_NOT_POSITIVE);
    if (!measured.is_measured()) throw SimulationError(errors::D3100_NOT_MEASURED);

    const StateVector sv = engine_->evolve(measured.without_markers());

    // Cumulative distribution; each shot is one inverse-CDF lookup.
    std::vector<double> cdf = sv.probabilities();
    std::partial_sum(cdf.begin(), cdf.end(), cdf.begin());
    const double acc = cdf.back();

    std::mt19937_64 rng(seed_ ? *seed_ : std::random_device{}());
    std::uniform_real_distribution<double> uni(0.0, acc);

    std::map<std::uint64_t, std::uint64_t> counts;
    for (std::int64_t s = 0; s < shots; ++s) {
        const double r = uni(rng);
        // upper_bound never lands on a zero-probability entry.
        auto it = std::upper_bound(cdf.begin(), cdf.end(), r);
        if (it == cdf.end()) --it;
        ++counts[static_cast<std::uint64_t>(it - cdf.begin())];
    }
    return CountDistribution(measured.num_qubits(), std::move(counts));
}

} // namespace ghzbench

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/ErrorCatalog.hpp"
#include "core/Topology.hpp"
#include "simulator/Circuit.hpp"
#include "simulator/CountDistribution.hpp"
#include "simulator/StateVector.hpp"

namespace ghzbench {

/**
 * @brief Evaluates a circuit to its final amplitude vector.
 *
 * Implementations throw SimulationError when no valid state can be
 * produced. Tests substitute their own engine to force that path.
 */
class StateSimulator {
public:
    virtual ~StateSimulator() = default;
    virtual std::string name() const = 0;
    // Evolves |0...0> through every non-marker gate of the circuit.
    virtual StateVector evolve(const Circuit& circuit) = 0;
};

// Dense in-memory simulator; memory grows as 16 * 2^n bytes.
class DenseStateSimulator : public StateSimulator {
public:
    explicit DenseStateSimulator(std::size_t max_qubits = kMaxRegisterQubits);

    std::string name() const override { return "dense"; }
    StateVector evolve(const Circuit& circuit) override;

    std::size_t max_qubits() const { return max_qubits_; }

private:
    std::size_t max_qubits_;
};

/**
 * @brief Shot sampler over the measured circuit.
 *
 * With a seed every call to run() replays the same pseudo-random stream,
 * so identical inputs give identical counts. Without one the stream is
 * seeded from std::random_device.
 */
class Simulator {
public:
    explicit Simulator(std::optional<std::uint64_t> seed = std::nullopt,
                       std::shared_ptr<StateSimulator> engine = nullptr);

    CountDistribution run(const Circuit& measured, std::int64_t shots);

    const std::optional<std::uint64_t>& seed() const { return seed_; }

private:
    std::optional<std::uint64_t> seed_;
    std::shared_ptr<StateSimulator> engine_;
};

} // namespace ghzbench

#pragma once

#include "simulator/Circuit.hpp"
#include "core/Topology.hpp"

namespace ghzbench {

// Rotation angle of the variational layer.
inline constexpr double kVariationalAngle = 0.78539816339744830962; // pi/4

struct CircuitPair {
    Circuit measured;   // barriers + final MEASURE ALL, for sampling
    Circuit exact;      // measurement-free twin, for exact simulation
};

/**
 * @brief Turns a TopologyDescriptor into its gate schedule.
 *
 * Deterministic: the same descriptor always yields the same gates.
 */
class CircuitBuilder {
public:
    explicit CircuitBuilder(const TopologyDescriptor& topology) : topology_(topology) {}

    Circuit build_measured() const;
    CircuitPair build() const;

private:
    void append_cascade(Circuit& c) const;
    void append_grouped_seed(Circuit& c) const;
    void append_variational_layer(Circuit& c) const;

    TopologyDescriptor topology_;
};

} // namespace ghzbench

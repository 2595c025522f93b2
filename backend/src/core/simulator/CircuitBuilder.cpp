#include "simulator/CircuitBuilder.hpp"

namespace ghzbench {

void CircuitBuilder::append_cascade(Circuit& c) const {
    const std::size_t n = topology_.num_qubits();
    c.append({GateKind::H, {0}, 0.0});
    for (std::size_t i = 0; i + 1 < n; ++i) {
        c.append({GateKind::CNOT, {i, i + 1}, 0.0});
    }
}

void CircuitBuilder::append_grouped_seed(Circuit& c) const {
    const auto& groups = topology_.groups();
    // Star seeding inside each group.
    for (const auto& g : groups) {
        const std::size_t seed = g.qubits.front();
        c.append({GateKind::H, {seed}, 0.0});
        for (std::size_t k = 1; k < g.qubits.size(); ++k) {
            c.append({GateKind::CNOT, {seed, g.qubits[k]}, 0.0});
        }
    }
    c.append({GateKind::BARRIER, {}, 0.0});
    // Link group boundaries: last qubit of group g drives first qubit of group g+1.
    for (std::size_t i = 0; i + 1 < groups.size(); ++i) {
        c.append({GateKind::CNOT, {groups[i].qubits.back(), groups[i + 1].qubits.front()}, 0.0});
    }
}

void CircuitBuilder::append_variational_layer(Circuit& c) const {
    const std::size_t n = topology_.num_qubits();
    for (std::size_t i = 0; i < n; ++i) {
        c.append({GateKind::RY, {i}, kVariationalAngle});
        if (i % 2 == 0 && i + 1 < n) c.append({GateKind::CNOT, {i, i + 1}, 0.0});
    }
}

Circuit CircuitBuilder::build_measured() const {
    Circuit c(topology_.num_qubits());
    switch (topology_.schedule()) {
        case ScheduleKind::Cascade:
            append_cascade(c);
            break;
        case ScheduleKind::GroupedSeed:
            append_grouped_seed(c);
            break;
        case ScheduleKind::GroupedSeedVariational:
            append_grouped_seed(c);
            c.append({GateKind::BARRIER, {}, 0.0});
            append_variational_layer(c);
            break;
    }
    c.append({GateKind::BARRIER, {}, 0.0});
    c.append({GateKind::MEASURE, {}, 0.0});
    return c;
}

CircuitPair CircuitBuilder::build() const {
    Circuit measured = build_measured();
    Circuit exact = measured.without_markers();
    return { std::move(measured), std::move(exact) };
}

} // namespace ghzbench

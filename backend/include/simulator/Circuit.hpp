#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ghzbench {

enum class GateKind { H, RY, CNOT, BARRIER, MEASURE };

struct Gate {
    GateKind kind;
    std::vector<std::size_t> qubits; // CNOT: {control, target}; markers: empty (all qubits)
    double angle = 0.0;              // RY only

    bool is_marker() const { return kind == GateKind::BARRIER || kind == GateKind::MEASURE; }
};

/**
 * @brief Ordered gate sequence over a fixed register.
 *
 * Gates are only appended while a CircuitBuilder assembles the circuit;
 * afterwards it is passed around by const reference.
 */
class Circuit {
public:
    explicit Circuit(std::size_t nqubits) : nqubits_(nqubits) {}

    std::size_t num_qubits() const { return nqubits_; }
    const std::vector<Gate>& gates() const { return gates_; }
    std::size_t size() const { return gates_.size(); }

    void append(Gate g) { gates_.push_back(std::move(g)); }

    bool is_measured() const;
    std::size_t count(GateKind kind) const;

    // Structural copy with barrier and measurement markers removed.
    Circuit without_markers() const;

    // OpenQASM 2.0 rendering (qelib1 gate names).
    std::string to_qasm() const;

private:
    std::size_t nqubits_;
    std::vector<Gate> gates_;
};

} // namespace ghzbench

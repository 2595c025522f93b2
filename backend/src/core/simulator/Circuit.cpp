#include "simulator/Circuit.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ghzbench {

bool Circuit::is_measured() const {
    return count(GateKind::MEASURE) > 0;
}

std::size_t Circuit::count(GateKind kind) const {
    return (std::size_t)std::count_if(gates_.begin(), gates_.end(), [kind](const Gate& g) { return g.kind == kind; });
}

Circuit Circuit::without_markers() const {
    Circuit out(nqubits_);
    for (const auto& g : gates_) {
        if (!g.is_marker()) out.append(g);
    }
    return out;
}

std::string Circuit::to_qasm() const {
    std::ostringstream out;
    out << "OPENQASM 2.0;\n";
    out << "include \"qelib1.inc\";\n";
    out << "qreg q[" << nqubits_ << "];\n";
    if (is_measured()) out << "creg meas[" << nqubits_ << "];\n";
    out << std::setprecision(17);
    for (const auto& g : gates_) {
        switch (g.kind) {
            case GateKind::H:
                out << "h q[" << g.qubits.at(0) << "];\n";
                break;
            case GateKind::RY:
                out << "ry(" << g.angle << ") q[" << g.qubits.at(0) << "];\n";
                break;
            case GateKind::CNOT:
                out << "cx q[" << g.qubits.at(0) << "],q[" << g.qubits.at(1) << "];\n";
                break;
            case GateKind::BARRIER:
                out << "barrier q;\n";
                break;
            case GateKind::MEASURE:
                for (std::size_t q = 0; q < nqubits_; ++q) out << "measure q[" << q << "] -> meas[" << q << "];\n";
                break;
        }
    }
    return out.str();
}

} // namespace ghzbench

#pragma once
#include <complex>
#include <cstddef>
#include <vector>

namespace ghzbench {

using cplx = std::complex<double>;

/**
 * @brief Dense 2^n amplitude vector.
 *
 * Index i holds the basis state whose qubit q equals (i >> q) & 1, so
 * index 0 is |0...0> and index 2^n - 1 is |1...1>.
 */
class StateVector {
public:
    // Starts in |0...0>.
    explicit StateVector(std::size_t n);

    // Apply a 2x2 unitary [[u00,u01],[u10,u11]] to one qubit.
    void apply_1q(std::size_t target, cplx u00, cplx u01, cplx u10, cplx u11);
    void apply_h(std::size_t target);
    void apply_ry(std::size_t target, double theta);
    void apply_cx(std::size_t control, std::size_t target);

    double probability(std::size_t basis_index) const;
    double norm2() const;
    std::vector<double> probabilities() const;

    std::size_t num_qubits() const { return n_qubits; }
    std::size_t dimension() const { return state.size(); }
    const std::vector<cplx>& amplitudes() const { return state; }

private:
    std::size_t n_qubits;
    std::vector<cplx> state;
};

} // namespace ghzbench

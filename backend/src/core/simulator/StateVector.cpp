#include "simulator/StateVector.hpp"

#include <cmath>
#include <utility>

namespace ghzbench {

StateVector::StateVector(std::size_t n)
: n_qubits(n), state(std::size_t(1) << n, cplx{0.0, 0.0}) {
    state[0] = {1.0, 0.0};
}

void StateVector::apply_1q(std::size_t target, cplx u00, cplx u01, cplx u10, cplx u11) {
    const std::size_t N = state.size();
    const std::size_t mask = std::size_t(1) << target;
    for (std::size_t i = 0; i < N; ++i) {
        if ((i & mask) == 0) {
            const std::size_t j = i | mask;
            const cplx a0 = state[i];
            const cplx a1 = state[j];
            state[i] = u00 * a0 + u01 * a1;
            state[j] = u10 * a0 + u11 * a1;
        }
    }
}

void StateVector::apply_h(std::size_t target) {
    const double s = 1.0 / std::sqrt(2.0);
    apply_1q(target, {s, 0}, {s, 0}, {s, 0}, {-s, 0});
}

void StateVector::apply_ry(std::size_t target, double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    apply_1q(target, {c, 0}, {-s, 0}, {s, 0}, {c, 0});
}

void StateVector::apply_cx(std::size_t control, std::size_t target) {
    if (control == target) return;
    const std::size_t N = state.size();
    const std::size_t cm = std::size_t(1) << control;
    const std::size_t tm = std::size_t(1) << target;
    for (std::size_t i = 0; i < N; ++i) {
        if ((i & cm) && !(i & tm)) std::swap(state[i], state[i | tm]);
    }
}

double StateVector::probability(std::size_t basis_index) const {
    return std::norm(state.at(basis_index));
}

double StateVector::norm2() const {
    // Kahan summation keeps the error flat for 2^24 terms.
    double sum = 0.0, c = 0.0;
    for (const auto& a : state) {
        const double y = std::norm(a) - c;
        const double t = sum + y;
        c = (t - sum) - y;
        sum = t;
    }
    return sum;
}

std::vector<double> StateVector::probabilities() const {
    std::vector<double> p(state.size());
    for (std::size_t i = 0; i < state.size(); ++i) p[i] = std::norm(state[i]);
    return p;
}

} // namespace ghzbench

#include "simulator/CountDistribution.hpp"

#include <algorithm>
#include <stdexcept>

namespace ghzbench {

CountDistribution::CountDistribution(std::size_t nqubits, std::map<std::uint64_t, std::uint64_t> counts)
: nqubits_(nqubits), counts_(std::move(counts)) {
    for (const auto& [idx, c] : counts_) total_ += c;
}

std::uint64_t CountDistribution::count(std::uint64_t basis_index) const {
    auto it = counts_.find(basis_index);
    return it == counts_.end() ? 0 : it->second;
}

std::uint64_t CountDistribution::count(const std::string& bitstring) const {
    return count(index_of(bitstring));
}

std::string CountDistribution::bitstring(std::uint64_t basis_index) const {
    std::string s(nqubits_, '0');
    for (std::size_t q = 0; q < nqubits_; ++q) {
        if ((basis_index >> q) & 1) s[nqubits_ - 1 - q] = '1';
    }
    return s;
}

std::uint64_t CountDistribution::index_of(const std::string& bitstring) const {
    if (bitstring.size() != nqubits_) throw std::invalid_argument("bitstring length does not match register: " + bitstring);
    std::uint64_t idx = 0;
    for (std::size_t p = 0; p < nqubits_; ++p) {
        const char ch = bitstring[p];
        if (ch != '0' && ch != '1') throw std::invalid_argument("bitstring must contain only 0/1: " + bitstring);
        if (ch == '1') idx |= (std::uint64_t(1) << (nqubits_ - 1 - p));
    }
    return idx;
}

std::vector<std::pair<std::string, std::uint64_t>> CountDistribution::top(std::size_t k) const {
    std::vector<std::pair<std::string, std::uint64_t>> out;
    out.reserve(counts_.size());
    for (const auto& [idx, c] : counts_) out.emplace_back(bitstring(idx), c);
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (out.size() > k) out.resize(k);
    return out;
}

} // namespace ghzbench

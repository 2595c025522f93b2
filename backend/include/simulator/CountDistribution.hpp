#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ghzbench {

/**
 * @brief Outcome histogram of a sampling run, keyed by basis index.
 *
 * Bitstrings are rendered big-endian: character p is qubit n-1-p.
 */
class CountDistribution {
public:
    CountDistribution(std::size_t nqubits, std::map<std::uint64_t, std::uint64_t> counts);

    std::size_t num_qubits() const { return nqubits_; }
    std::uint64_t total() const { return total_; }
    const std::map<std::uint64_t, std::uint64_t>& counts() const { return counts_; }
    std::uint64_t count(std::uint64_t basis_index) const;
    std::uint64_t count(const std::string& bitstring) const;

    std::string bitstring(std::uint64_t basis_index) const;
    std::uint64_t index_of(const std::string& bitstring) const;

    // At most k outcomes by descending count; ties broken by ascending bitstring.
    std::vector<std::pair<std::string, std::uint64_t>> top(std::size_t k) const;

    bool operator==(const CountDistribution& other) const {
        return nqubits_ == other.nqubits_ && counts_ == other.counts_;
    }

private:
    std::size_t nqubits_;
    std::map<std::uint64_t, std::uint64_t> counts_;
    std::uint64_t total_ = 0;
};

} // namespace ghzbench

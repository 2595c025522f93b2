#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ghzbench {

inline constexpr std::size_t kMaxRegisterQubits = 24;

enum class ScheduleKind {
    Cascade,                 // H on q0, then CNOT chain i -> i+1
    GroupedSeed,             // per-group star seeding + inter-group links
    GroupedSeedVariational   // grouped seed followed by an RY/CNOT ansatz layer
};

std::string to_string(ScheduleKind kind);
// Throws std::invalid_argument for unknown names.
ScheduleKind schedule_from_string(const std::string& name);

struct NodeGroup {
    std::string node;
    std::vector<std::size_t> qubits;

    // Bitmask over basis indices selecting this group's qubits.
    std::uint64_t mask() const;
};

/**
 * @brief Register size, grouping scheme and schedule shape of one run.
 *
 * Immutable once validated; every pipeline stage reads it by const
 * reference.
 */
class TopologyDescriptor {
public:
    TopologyDescriptor(std::size_t qubits, std::vector<NodeGroup> groups, ScheduleKind schedule);

    // Consecutive groups of group_size qubits, one per name, starting at qubit 0.
    static TopologyDescriptor uniform(std::size_t qubits, std::size_t group_size,
                                      const std::vector<std::string>& node_names,
                                      ScheduleKind schedule);

    static TopologyDescriptor from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    std::size_t num_qubits() const { return qubits_; }
    const std::vector<NodeGroup>& groups() const { return groups_; }
    ScheduleKind schedule() const { return schedule_; }
    std::size_t group_size() const { return groups_.empty() ? 0 : groups_.front().qubits.size(); }

private:
    void validate() const;

    std::size_t qubits_;
    std::vector<NodeGroup> groups_;
    ScheduleKind schedule_;
};

} // namespace ghzbench

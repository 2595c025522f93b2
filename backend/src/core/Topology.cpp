#include "core/Topology.hpp"
#include "core/ErrorCatalog.hpp"

#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace ghzbench {

static std::invalid_argument config_error(const char* detail) {
    return std::invalid_argument(errors::format_E3200_config_rejected(detail));
}

std::string to_string(ScheduleKind kind) {
    switch (kind) {
        case ScheduleKind::Cascade: return "cascade";
        case ScheduleKind::GroupedSeed: return "grouped_seed";
        case ScheduleKind::GroupedSeedVariational: return "grouped_seed_variational";
    }
    return "cascade";
}

ScheduleKind schedule_from_string(const std::string& name) {
    if (name == "cascade") return ScheduleKind::Cascade;
    if (name == "grouped_seed") return ScheduleKind::GroupedSeed;
    if (name == "grouped_seed_variational") return ScheduleKind::GroupedSeedVariational;
    throw config_error(errors::D3200_UNKNOWN_SCHEDULE);
}

std::uint64_t NodeGroup::mask() const {
    std::uint64_t m = 0;
    for (auto q : qubits) m |= (std::uint64_t(1) << q);
    return m;
}

TopologyDescriptor::TopologyDescriptor(std::size_t qubits, std::vector<NodeGroup> groups, ScheduleKind schedule)
: qubits_(qubits), groups_(std::move(groups)), schedule_(schedule) {
    validate();
}

TopologyDescriptor TopologyDescriptor::uniform(std::size_t qubits, std::size_t group_size,
                                               const std::vector<std::string>& node_names,
                                               ScheduleKind schedule) {
    if (group_size == 0 || group_size > qubits) throw config_error(errors::D3200_GROUP_SIZE_INVALID);
    // Checked before any index is generated; oversized requests must not allocate.
    if (node_names.size() > qubits / group_size) throw config_error(errors::D3200_GROUP_SIZE_INVALID);
    std::vector<NodeGroup> groups;
    groups.reserve(node_names.size());
    std::size_t next = 0;
    for (const auto& name : node_names) {
        NodeGroup g;
        g.node = name;
        for (std::size_t k = 0; k < group_size; ++k) g.qubits.push_back(next++);
        groups.push_back(std::move(g));
    }
    return TopologyDescriptor(qubits, std::move(groups), schedule);
}

void TopologyDescriptor::validate() const {
    if (qubits_ == 0 || qubits_ > kMaxRegisterQubits) throw config_error(errors::D3200_QUBITS_OUT_OF_RANGE);
    if (groups_.empty()) throw config_error(errors::D3200_NO_GROUPS);

    const std::size_t size = groups_.front().qubits.size();
    std::set<std::size_t> seen;
    std::set<std::string> names;
    for (const auto& g : groups_) {
        if (g.qubits.empty()) throw config_error(errors::D3200_EMPTY_GROUP);
        if (g.qubits.size() != size) throw config_error(errors::D3200_GROUP_SIZE_NOT_UNIFORM);
        if (!names.insert(g.node).second) throw config_error(errors::D3200_DUPLICATE_NODE);
        for (auto q : g.qubits) {
            if (q >= qubits_) throw config_error(errors::D3200_GROUP_INDEX_OUT_OF_RANGE);
            if (!seen.insert(q).second) throw config_error(errors::D3200_GROUPS_OVERLAP);
        }
    }
}

TopologyDescriptor TopologyDescriptor::from_json(const json& j) {
    if (!j.is_object()) throw config_error(errors::D3200_CONFIG_NOT_OBJECT);

    const auto qubits = j.value("qubits", std::size_t(12));
    const auto schedule = schedule_from_string(j.value("schedule", std::string("cascade")));

    // Explicit node list wins over group_size + node_names.
    if (j.contains("nodes") && j["nodes"].is_array() && !j["nodes"].empty()) {
        std::vector<NodeGroup> groups;
        for (const auto& n : j["nodes"]) {
            if (!n.is_object()) throw config_error(errors::D3200_NODE_NOT_OBJECT);
            NodeGroup g;
            g.node = n.value("id", std::string("node") + std::to_string(groups.size()));
            for (const auto& q : n.value("qubits", json::array())) {
                if (!q.is_number_integer() || q.get<long long>() < 0) throw config_error(errors::D3200_GROUP_INDEX_OUT_OF_RANGE);
                g.qubits.push_back(q.get<std::size_t>());
            }
            groups.push_back(std::move(g));
        }
        return TopologyDescriptor(qubits, std::move(groups), schedule);
    }

    const auto group_size = j.value("group_size", std::size_t(3));
    std::vector<std::string> names;
    if (j.contains("node_names") && j["node_names"].is_array()) {
        for (const auto& n : j["node_names"]) {
            if (n.is_string()) names.push_back(n.get<std::string>());
        }
    }
    if (names.empty() && group_size > 0) {
        for (std::size_t i = 0; i < qubits / group_size; ++i) names.push_back("node" + std::to_string(i));
    }
    return uniform(qubits, group_size, names, schedule);
}

json TopologyDescriptor::to_json() const {
    json nodes = json::array();
    for (const auto& g : groups_) {
        nodes.push_back({ {"id", g.node}, {"qubits", g.qubits} });
    }
    return {
        {"qubits", qubits_},
        {"schedule", to_string(schedule_)},
        {"nodes", nodes}
    };
}

} // namespace ghzbench

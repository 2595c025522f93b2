#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Topology.hpp"

namespace ghzbench {

/**
 * @brief Everything one benchmark run needs besides its collaborators.
 *
 * JSON keys: label, qubits, schedule, shots, seed, nodes, group_size,
 * node_names, anchor_url, correction_url, reports_dir, history_path,
 * parallel, max_qubits, and optionally preset as the base document.
 */
struct RunConfig {
    explicit RunConfig(TopologyDescriptor topo) : topology(std::move(topo)) {}

    std::string label = "ghz_run";
    TopologyDescriptor topology;
    std::int64_t shots = 2048;
    std::optional<std::uint64_t> seed;
    std::string reports_dir;
    std::string history_path;
    std::string anchor_url;
    std::string correction_url;
    bool parallel = false;
    std::size_t max_qubits = kMaxRegisterQubits;

    // Invalid topology or unknown preset: std::invalid_argument (E3200).
    static RunConfig from_json(const nlohmann::json& j);
    static RunConfig load_file(const std::string& path);
    static RunConfig preset(const std::string& name);

    static nlohmann::json preset_json(const std::string& name);
    static std::vector<std::string> preset_names();

    // GHZBENCH_REPORTS_DIR, GHZBENCH_HISTORY_PATH, GHZBENCH_ANCHOR_URL, GHZBENCH_CORRECTION_URL
    void apply_env();

    nlohmann::json to_json() const;
};

} // namespace ghzbench

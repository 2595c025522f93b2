#include "core/RunConfig.hpp"
#include "core/ErrorCatalog.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ghzbench {

json RunConfig::preset_json(const std::string& name) {
    if (name == "qip2") {
        return {
            {"label", "qip2"},
            {"qubits", 12},
            {"schedule", "cascade"},
            {"shots", 2048},
            {"group_size", 3},
            {"node_names", {"CERN", "NASA", "xAI", "Starlink"}}
        };
    }
    if (name == "qip10") {
        return {
            {"label", "qip10"},
            {"qubits", 24},
            {"schedule", "grouped_seed_variational"},
            {"shots", 4096},
            {"group_size", 3},
            {"node_names", {"CERN", "NASA", "xAI", "Starlink", "NeuralHealth", "MirrorMe", "EveBond", "ValleyKing"}}
        };
    }
    throw std::invalid_argument(errors::format_E3200_config_rejected(
        std::string(errors::D3200_UNKNOWN_PRESET) + ": " + name));
}

std::vector<std::string> RunConfig::preset_names() {
    return {"qip2", "qip10"};
}

RunConfig RunConfig::preset(const std::string& name) {
    return from_json(preset_json(name));
}

RunConfig RunConfig::from_json(const json& in) {
    if (!in.is_object()) throw std::invalid_argument(errors::format_E3200_config_rejected(errors::D3200_CONFIG_NOT_OBJECT));

    json j = in;
    if (in.contains("preset") && in["preset"].is_string()) {
        j = preset_json(in["preset"].get<std::string>());
        // An explicit node list replaces the preset's uniform grouping.
        if (in.contains("nodes")) {
            j.erase("group_size");
            j.erase("node_names");
        } else if (!in.contains("node_names") &&
                   (in.contains("group_size") || (in.contains("qubits") && in["qubits"] != j["qubits"]))) {
            // Resized register: fall back to generated node names.
            j.erase("node_names");
        }
        j.update(in);
        j.erase("preset");
    }

    try {
        RunConfig cfg(TopologyDescriptor::from_json(j));
        cfg.label = j.value("label", cfg.label);
        cfg.shots = j.value("shots", cfg.shots);
        if (j.contains("seed") && !j["seed"].is_null()) cfg.seed = j["seed"].get<std::uint64_t>();
        cfg.reports_dir = j.value("reports_dir", std::string{});
        cfg.history_path = j.value("history_path", std::string{});
        cfg.anchor_url = j.value("anchor_url", std::string{});
        cfg.correction_url = j.value("correction_url", std::string{});
        cfg.parallel = j.value("parallel", false);
        cfg.max_qubits = j.value("max_qubits", kMaxRegisterQubits);
        return cfg;
    } catch (const json::exception& e) {
        // wrong value types in an otherwise valid document
        throw std::invalid_argument(errors::format_E3200_config_rejected(e.what()));
    }
}

RunConfig RunConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::invalid_argument(errors::format_E3200_config_rejected(
            std::string(errors::D3200_CONFIG_OPEN_FAILED) + ": " + path));
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        throw std::invalid_argument(errors::format_E3200_config_rejected("invalid JSON in " + path));
    }
    return from_json(j);
}

void RunConfig::apply_env() {
    auto env = [](const char* name, std::string& field) {
        const char* v = std::getenv(name);
        if (v && *v) field = v;
    };
    env("GHZBENCH_REPORTS_DIR", reports_dir);
    env("GHZBENCH_HISTORY_PATH", history_path);
    env("GHZBENCH_ANCHOR_URL", anchor_url);
    env("GHZBENCH_CORRECTION_URL", correction_url);
}

json RunConfig::to_json() const {
    json j = topology.to_json();
    j["label"] = label;
    j["shots"] = shots;
    j["seed"] = seed ? json(*seed) : json(nullptr);
    j["reports_dir"] = reports_dir;
    j["history_path"] = history_path;
    j["anchor_url"] = anchor_url;
    j["correction_url"] = correction_url;
    j["parallel"] = parallel;
    j["max_qubits"] = max_qubits;
    return j;
}

} // namespace ghzbench

#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Pipeline.hpp"
#include "core/RunConfig.hpp"
#include "core/RunHistory.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace ghzbench;

namespace {

enum ExitCode {
    kExitComplete = 0,
    kExitFailed = 1,
    kExitBadArgs = 2,
    kExitSimulation = 3,
    kExitPersistence = 4
};

std::string preset_list() {
    std::string out;
    for (const auto& name : RunConfig::preset_names()) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help               Show this help message and exit\n"
              << "      --version            Print version and build info\n"
              << "      --config FILE        Load run configuration from a JSON file\n"
              << "      --preset NAME        Start from a built-in preset (" << preset_list() << ")\n"
              << "      --qubits N           Register size (1-" << kMaxRegisterQubits << ")\n"
              << "      --group-size K       Qubits per node (consecutive groups)\n"
              << "      --schedule KIND      cascade | grouped_seed | grouped_seed_variational\n"
              << "      --shots K            Sampling trials\n"
              << "      --seed S             Fixed sampling seed\n"
              << "      --label NAME         Run label\n"
              << "      --reports-dir DIR    Report output directory\n"
              << "      --history FILE       Run history log (JSON Lines)\n"
              << "      --anchor-url URL     Ledger endpoint, ws://host:port/path\n"
              << "      --correction-url URL QEC service base, http://host:port\n"
              << "      --parallel           Run exact and sampling simulation concurrently\n"
              << "      --no-save            Do not write the report or history\n"
              << "      --print              Dump the report JSON to stdout\n"
              << "      --history-summary    Print a summary of the history log and exit\n"
              << "      --dump-config        Print the resolved run configuration and exit\n"
              << std::flush;
}

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> preset;
    json overrides = json::object();
    std::optional<std::string> reports_dir;
    std::optional<std::string> history_path;
    std::optional<std::string> anchor_url;
    std::optional<std::string> correction_url;
    bool save = true;
    bool print = false;
    bool history_summary = false;
    bool dump_config = false;
};

std::int64_t parse_int(const std::string& flag, const std::string& v) {
    try {
        std::size_t pos = 0;
        long long x = std::stoll(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return x;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + v + "'");
    }
}

CliOptions parse_args(int argc, char** argv, bool& exit_early) {
    CliOptions o;
    auto need = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            exit_early = true;
            return o;
        }
        if (a == "--version") {
            std::cout << "ghzbench " << buildinfo::version()
                      << " (" << buildinfo::git_commit() << ", built " << buildinfo::build_time_utc_approx() << ")"
                      << std::endl;
            exit_early = true;
            return o;
        }
        if (a == "--config") o.config_path = need(i, a);
        else if (a == "--preset") o.preset = need(i, a);
        else if (a == "--qubits") o.overrides["qubits"] = parse_int(a, need(i, a));
        else if (a == "--group-size") o.overrides["group_size"] = parse_int(a, need(i, a));
        else if (a == "--schedule") o.overrides["schedule"] = need(i, a);
        else if (a == "--shots") o.overrides["shots"] = parse_int(a, need(i, a));
        else if (a == "--seed") {
            const auto s = parse_int(a, need(i, a));
            if (s < 0) throw std::invalid_argument("--seed must be non-negative");
            o.overrides["seed"] = static_cast<std::uint64_t>(s);
        }
        else if (a == "--label") o.overrides["label"] = need(i, a);
        else if (a == "--reports-dir") o.reports_dir = need(i, a);
        else if (a == "--history") o.history_path = need(i, a);
        else if (a == "--anchor-url") o.anchor_url = need(i, a);
        else if (a == "--correction-url") o.correction_url = need(i, a);
        else if (a == "--parallel") o.overrides["parallel"] = true;
        else if (a == "--no-save") o.save = false;
        else if (a == "--print") o.print = true;
        else if (a == "--history-summary") o.history_summary = true;
        else if (a == "--dump-config") o.dump_config = true;
        else throw std::invalid_argument("unknown option: " + a);
    }
    return o;
}

json load_base_document(const CliOptions& o) {
    json doc = json::object();
    if (o.config_path) {
        std::ifstream f(*o.config_path);
        if (!f) {
            throw std::invalid_argument(errors::format_E3200_config_rejected(
                std::string(errors::D3200_CONFIG_OPEN_FAILED) + ": " + *o.config_path));
        }
        doc = json::parse(f, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            throw std::invalid_argument(errors::format_E3200_config_rejected(errors::D3200_CONFIG_NOT_OBJECT));
        }
    }
    if (o.preset) doc["preset"] = *o.preset;
    if (!o.config_path && !o.preset) doc["preset"] = "qip2";
    // Sizing flags rebuild uniform groups instead of reusing the file's node list.
    if (o.overrides.contains("qubits") || o.overrides.contains("group_size")) {
        doc.erase("nodes");
        if (o.overrides.contains("qubits")) doc.erase("node_names");
    }
    doc.update(o.overrides);
    return doc;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    std::optional<RunConfig> cfg;
    try {
        bool exit_early = false;
        opts = parse_args(argc, argv, exit_early);
        if (exit_early) return kExitComplete;

        cfg = RunConfig::from_json(load_base_document(opts));
        cfg->apply_env();
        if (opts.reports_dir) cfg->reports_dir = *opts.reports_dir;
        if (opts.history_path) cfg->history_path = *opts.history_path;
        if (opts.anchor_url) cfg->anchor_url = *opts.anchor_url;
        if (opts.correction_url) cfg->correction_url = *opts.correction_url;
    } catch (const std::invalid_argument& e) {
        std::cerr << "ghzbench: " << e.what() << std::endl;
        print_usage(argv[0]);
        return kExitBadArgs;
    }

    if (opts.dump_config) {
        std::cout << cfg->to_json().dump(2) << std::endl;
        return kExitComplete;
    }

    if (opts.history_summary) {
        RunHistory history(cfg->history_path);
        const auto s = history.summary();
        std::cout << "History " << history.path() << ": runs=" << s.runs << " complete=" << s.complete
                  << " mean_composite=" << s.mean_composite
                  << " best_composite=" << s.best_composite;
        if (!s.best_label.empty()) std::cout << " (" << s.best_label << ")";
        std::cout << std::endl;
        return kExitComplete;
    }

    try {
        Pipeline pipeline = Pipeline::from_config(*cfg, opts.save);
        RunOutcome out = pipeline.run(*cfg);
        const Report& r = out.report;

        if (opts.print) std::cout << r.to_json().dump(2) << std::endl;
        std::cout << r.run_label() << ": " << to_string(r.status())
                  << " exact=" << r.fidelity().exact << (r.fidelity().exact_fallback ? " (fallback)" : "")
                  << " raw=" << r.fidelity().raw
                  << " used=" << r.fidelity_used()
                  << " composite=" << r.composite_index()
                  << " digest=" << r.digest().substr(0, 12);
        if (r.anchor().anchored) std::cout << " entry=" << *r.anchor().entry_hash;
        if (out.persisted_path) std::cout << " -> " << *out.persisted_path;
        std::cout << std::endl;

        return r.status() == RunStatus::Complete ? kExitComplete : kExitFailed;
    } catch (const SimulationError& e) {
        std::cerr << "ghzbench: " << e.what() << std::endl;
        return kExitSimulation;
    } catch (const std::logic_error& e) {
        std::cerr << "ghzbench: internal invariant violated: " << e.what() << std::endl;
        return kExitSimulation;
    } catch (const std::runtime_error& e) {
        std::cerr << "ghzbench: " << e.what() << std::endl;
        return kExitPersistence;
    }
}

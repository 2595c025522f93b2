#include "core/RunHistory.hpp"

#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace ghzbench {

RunHistory::RunHistory(std::string path) : path_(std::move(path)) {
    if (path_.empty()) path_ = resolve_history_path();
}

int64_t RunHistory::now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string RunHistory::resolve_history_path() {
    const char* env = std::getenv("GHZBENCH_HISTORY_PATH");
    if (env && *env) return std::string(env);
    return (std::filesystem::current_path() / "reports" / "history.jsonl").string();
}

json RunHistory::to_line(const Report& report, int64_t ts_ms) {
    const auto& anchor = report.anchor();
    return {
        {"type", "run"},
        {"ts_ms", ts_ms},
        {"label", report.run_label()},
        {"status", to_string(report.status())},
        {"composite_index", report.composite_index()},
        {"fidelity_used", report.fidelity_used()},
        {"digest", report.digest()},
        {"entry_hash", anchor.entry_hash ? json(*anchor.entry_hash) : json(nullptr)}
    };
}

void RunHistory::append(const Report& report) {
    std::lock_guard<std::mutex> lk(file_m_);

    std::filesystem::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    const bool fresh = !std::filesystem::exists(p, ec) || std::filesystem::file_size(p, ec) == 0;

    std::ofstream file(path_, std::ios::out | std::ios::app);
    if (!file) {
        throw std::runtime_error(errors::format_E3310_persist_failed(
            std::string(errors::D3310_OPEN_HISTORY_FAILED) + ": " + path_));
    }

    const int64_t ts = now_ms();
    if (fresh) {
        // Header line: provenance of the log.
        json header = {
            {"type", "ghzbench_history"},
            {"schema_version", 1},
            {"created_ts_ms", ts},
            {"meta", {
                {"version", buildinfo::version()},
                {"git_commit", buildinfo::git_commit()},
                {"build_time", buildinfo::build_time_utc_approx()}
            }}
        };
        file << header.dump() << "\n";
    }
    file << to_line(report, ts).dump() << "\n";
    file.flush();
    if (!file) {
        throw std::runtime_error(errors::format_E3310_persist_failed(
            std::string(errors::D3310_OPEN_HISTORY_FAILED) + ": " + path_));
    }
}

std::vector<HistoryEntry> RunHistory::load() const {
    return load(path_);
}

std::vector<HistoryEntry> RunHistory::load(const std::string& path) {
    std::vector<HistoryEntry> out;
    std::ifstream f(path);
    if (!f) return out;

    std::string line;
    std::size_t lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "RunHistory: skipping malformed line " << lineno << " in " << path << std::endl;
            continue;
        }
        if (j.value("type", std::string{}) != "run") continue;
        try {
            HistoryEntry e;
            e.ts_ms = j.value("ts_ms", (int64_t)0);
            e.label = j.value("label", std::string{});
            e.status = j.value("status", std::string{});
            e.composite_index = j.value("composite_index", 0.0);
            e.fidelity_used = j.value("fidelity_used", 0.0);
            e.digest = j.value("digest", std::string{});
            if (j.contains("entry_hash") && j["entry_hash"].is_string()) e.entry_hash = j["entry_hash"].get<std::string>();
            out.push_back(std::move(e));
        } catch (const json::exception& ex) {
            std::cerr << "RunHistory: skipping line " << lineno << ": " << ex.what() << std::endl;
        }
    }
    return out;
}

HistorySummary RunHistory::summarize(const std::vector<HistoryEntry>& entries) {
    HistorySummary s;
    double sum = 0.0;
    for (const auto& e : entries) {
        if (s.runs == 0 || e.composite_index > s.best_composite) {
            s.best_composite = e.composite_index;
            s.best_label = e.label;
        }
        sum += e.composite_index;
        if (e.status == "COMPLETE") ++s.complete;
        ++s.runs;
    }
    if (s.runs > 0) s.mean_composite = sum / static_cast<double>(s.runs);
    return s;
}

} // namespace ghzbench

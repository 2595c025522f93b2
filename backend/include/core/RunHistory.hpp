#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Report.hpp"

namespace ghzbench {

struct HistoryEntry {
    int64_t ts_ms = 0;
    std::string label;
    std::string status;
    double composite_index = 0.0;
    double fidelity_used = 0.0;
    std::string digest;
    std::optional<std::string> entry_hash;
};

struct HistorySummary {
    std::size_t runs = 0;
    std::size_t complete = 0;
    double mean_composite = 0.0;
    double best_composite = 0.0;
    std::string best_label;
};

/**
 * @brief Append-only JSON Lines log of completed runs.
 *
 * A new file starts with a "ghzbench_history" header line; each run adds
 * one "run" line. Existing lines are never rewritten.
 */
class RunHistory {
public:
    // Empty path: GHZBENCH_HISTORY_PATH, else ./reports/history.jsonl.
    explicit RunHistory(std::string path = {});

    // Throws std::runtime_error (E3310) if the log cannot be opened.
    void append(const Report& report);

    // Entries in file order; header and malformed lines are skipped.
    std::vector<HistoryEntry> load() const;
    static std::vector<HistoryEntry> load(const std::string& path);

    HistorySummary summary() const { return summarize(load()); }
    static HistorySummary summarize(const std::vector<HistoryEntry>& entries);

    const std::string& path() const { return path_; }

    static std::string resolve_history_path();
    static nlohmann::json to_line(const Report& report, int64_t ts_ms);

private:
    static int64_t now_ms();

    std::string path_;
    std::mutex file_m_;
};

} // namespace ghzbench

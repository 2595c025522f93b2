#pragma once

#include <string>

#include "core/Report.hpp"

namespace ghzbench {

/**
 * @brief Writes finished reports as pretty JSON.
 *
 * Layout: <reports_dir>/<YYYY-MM-DD>/<label>_<YYYYmmdd_HHMMSS>_<id8>.json
 */
class ReportSink {
public:
    // Empty dir: GHZBENCH_REPORTS_DIR, else ./reports.
    explicit ReportSink(std::string reports_dir = {});

    // Returns the written path. Throws std::runtime_error (E3310) on I/O failure.
    std::string persist(const Report& report) const;

    const std::string& reports_dir() const { return dir_; }

    static std::string resolve_reports_dir();
    // Replaces anything outside [A-Za-z0-9_.-] with '_'.
    static std::string sanitize(std::string base);

private:
    std::string dir_;
};

} // namespace ghzbench

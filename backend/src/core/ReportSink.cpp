#include "core/ReportSink.hpp"
#include "core/ErrorCatalog.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace ghzbench {

static std::string random_id8() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(8);
    const auto v = rng();
    for (int i = 0; i < 8; ++i) out.push_back(hex[(v >> (i * 4)) & 0xF]);
    return out;
}

ReportSink::ReportSink(std::string reports_dir) : dir_(std::move(reports_dir)) {
    if (dir_.empty()) dir_ = resolve_reports_dir();
}

std::string ReportSink::resolve_reports_dir() {
    const char* env = std::getenv("GHZBENCH_REPORTS_DIR");
    if (env && *env) return std::string(env);
    return (std::filesystem::current_path() / "reports").string();
}

std::string ReportSink::sanitize(std::string base) {
    for (char& c : base) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.')) c = '_';
    }
    if (base.empty()) base = "report";
    return base;
}

std::string ReportSink::persist(const Report& report) const {
    auto t = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream day, stamp;
    day << std::put_time(&tm, "%Y-%m-%d");
    stamp << std::put_time(&tm, "%Y%m%d_%H%M%S");

    std::filesystem::path day_dir = std::filesystem::path(dir_) / day.str();
    std::error_code ec;
    std::filesystem::create_directories(day_dir, ec);
    if (ec) {
        throw std::runtime_error(errors::format_E3310_persist_failed(
            std::string(errors::D3310_OPEN_FILE_FAILED) + ": " + day_dir.string() + ": " + ec.message()));
    }

    std::filesystem::path path = day_dir / (sanitize(report.run_label()) + "_" + stamp.str() + "_" + random_id8() + ".json");
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        throw std::runtime_error(errors::format_E3310_persist_failed(
            std::string(errors::D3310_OPEN_FILE_FAILED) + ": " + path.string()));
    }
    f << report.to_json().dump(2) << "\n";
    f.flush();
    if (!f) {
        throw std::runtime_error(errors::format_E3310_persist_failed(
            std::string(errors::D3310_OPEN_FILE_FAILED) + ": " + path.string()));
    }
    std::cout << "ReportSink: wrote " << path.string() << std::endl;
    return path.string();
}

} // namespace ghzbench

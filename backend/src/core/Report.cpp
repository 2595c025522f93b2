#include "core/Report.hpp"
#include "core/BuildInfo.hpp"

#include <openssl/sha.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ghzbench {

std::string to_string(RunStatus s) {
    return s == RunStatus::Complete ? "COMPLETE" : "FAILED";
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char b : hash) ss << std::setw(2) << static_cast<int>(b);
    return ss.str();
}

std::string iso_timestamp_now() {
    auto t = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

json Report::digest_source() const {
    json grouping = json::array();
    for (const auto& g : grouping_) grouping.push_back({{"node", g.node}, {"qubits", g.qubits}});

    json correlations = json::object();
    for (const auto& [node, v] : correlations_) correlations[node] = v;

    json top = json::array();
    for (const auto& o : top_) top.push_back({{"bitstring", o.bitstring}, {"count", o.count}});

    return {
        {"schema_version", kReportSchemaVersion},
        {"run_label", run_label_},
        {"timestamp", timestamp_},
        {"status", to_string(status_)},
        {"qubits", qubits_},
        {"shots", shots_},
        {"schedule", to_string(schedule_)},
        {"grouping", grouping},
        {"fidelity", {
            {"exact", fidelity_.exact},
            {"raw", fidelity_.raw},
            {"used", correction_.fidelity_used},
            {"exact_fallback", fidelity_.exact_fallback},
            {"theoretical_baseline", kTheoreticalBaseline}
        }},
        {"correction", {
            {"applied", correction_.applied},
            {"stability", correction_.stability},
            {"error_rate", correction_.error_rate}
        }},
        {"node_correlations", correlations},
        {"composite_index", composite_},
        {"top_outcomes", top},
        {"circuit_qasm", circuit_qasm_},
        {"build", {
            {"git_commit", git_commit_},
            {"build_time", build_time_}
        }}
    };
}

json Report::to_json() const {
    json j = digest_source();
    j["digest"] = digest_;
    j["anchor"] = {
        {"anchored", anchor_.anchored},
        {"entry_hash", anchor_.entry_hash ? json(*anchor_.entry_hash) : json(nullptr)},
        {"ots_proof", anchor_.ots_proof ? json(*anchor_.ots_proof) : json(nullptr)}
    };
    return j;
}

json Report::anchor_payload() const {
    return {
        {"digest", digest_},
        {"composite_index", composite_},
        {"fidelity", correction_.fidelity_used},
        {"status", to_string(status_)},
        {"qubits", qubits_}
    };
}

Report Report::with_anchor(const AnchorEntry& entry) const {
    if (entry.entry_hash.empty()) throw std::invalid_argument("anchor entry without hash");
    Report out = *this;
    out.anchor_.anchored = true;
    out.anchor_.entry_hash = entry.entry_hash;
    out.anchor_.ots_proof = entry.ots_proof;
    return out;
}

Report ReportAssembler::assemble(const std::string& run_label,
                                 const TopologyDescriptor& topology,
                                 std::int64_t shots,
                                 const Circuit& measured,
                                 const CountDistribution& counts,
                                 const FidelityMetrics& fidelity,
                                 const CorrectionSummary& correction,
                                 const CorrelationMap& correlations,
                                 double composite_index,
                                 std::string timestamp) {
    if (shots <= 0 || counts.total() != static_cast<std::uint64_t>(shots)) {
        throw std::logic_error("count distribution total " + std::to_string(counts.total()) +
                               " does not match shots " + std::to_string(shots));
    }
    if (correlations.size() != topology.groups().size()) {
        throw std::logic_error("correlation map does not cover every node");
    }
    require_unit_range("exact fidelity", fidelity.exact);
    require_unit_range("raw fidelity", fidelity.raw);
    require_unit_range("fidelity used", correction.fidelity_used);
    for (const auto& [node, v] : correlations) require_unit_range("correlation for " + node, v);
    require_unit_range("composite index", composite_index);

    Report r;
    r.run_label_ = run_label;
    r.timestamp_ = timestamp.empty() ? iso_timestamp_now() : std::move(timestamp);
    r.status_ = correction.fidelity_used >= kCompleteThreshold ? RunStatus::Complete : RunStatus::Failed;
    r.qubits_ = topology.num_qubits();
    r.shots_ = shots;
    r.schedule_ = topology.schedule();
    r.grouping_ = topology.groups();
    r.fidelity_ = fidelity;
    r.correction_ = correction;
    r.correlations_ = correlations;
    r.composite_ = composite_index;
    for (const auto& [bits, c] : counts.top(kTopOutcomes)) r.top_.push_back({bits, c});
    r.circuit_qasm_ = measured.to_qasm();
    r.git_commit_ = buildinfo::git_commit();
    r.build_time_ = buildinfo::build_time_utc_approx();
    r.digest_ = sha256_hex(r.digest_source().dump());
    return r;
}

} // namespace ghzbench

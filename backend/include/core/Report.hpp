#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Metrics.hpp"
#include "core/Topology.hpp"
#include "net/AnchorClient.hpp"
#include "simulator/Circuit.hpp"
#include "simulator/CountDistribution.hpp"

namespace ghzbench {

inline constexpr int kReportSchemaVersion = 1;
inline constexpr std::size_t kTopOutcomes = 10;
// Single pass/fail gate on fidelity_used.
inline constexpr double kCompleteThreshold = 0.97;

enum class RunStatus { Complete, Failed };
std::string to_string(RunStatus s);

struct OutcomeCount {
    std::string bitstring;
    std::uint64_t count = 0;
};

struct AnchorFields {
    bool anchored = false;
    std::optional<std::string> entry_hash;
    std::optional<std::string> ots_proof;
};

/**
 * @brief Immutable snapshot of one benchmark run.
 *
 * Only ReportAssembler builds one. Anchoring produces a new Report that
 * differs in the anchor fields alone.
 */
class Report {
public:
    const std::string& run_label() const { return run_label_; }
    const std::string& timestamp() const { return timestamp_; }
    RunStatus status() const { return status_; }
    std::size_t qubits() const { return qubits_; }
    std::int64_t shots() const { return shots_; }
    ScheduleKind schedule() const { return schedule_; }
    const std::vector<NodeGroup>& grouping() const { return grouping_; }
    const FidelityMetrics& fidelity() const { return fidelity_; }
    const CorrectionSummary& correction() const { return correction_; }
    double fidelity_used() const { return correction_.fidelity_used; }
    const CorrelationMap& node_correlations() const { return correlations_; }
    double composite_index() const { return composite_; }
    const std::vector<OutcomeCount>& top_outcomes() const { return top_; }
    const std::string& circuit_qasm() const { return circuit_qasm_; }
    const std::string& digest() const { return digest_; }
    const AnchorFields& anchor() const { return anchor_; }

    // Full wire form, including digest and anchor.
    nlohmann::json to_json() const;
    // Wire form without digest and anchor; the digest is taken over its dump().
    nlohmann::json digest_source() const;

    // Payload sent to the ledger.
    nlohmann::json anchor_payload() const;
    Report with_anchor(const AnchorEntry& entry) const;

private:
    friend class ReportAssembler;
    Report() = default;

    std::string run_label_;
    std::string timestamp_;
    RunStatus status_ = RunStatus::Failed;
    std::size_t qubits_ = 0;
    std::int64_t shots_ = 0;
    ScheduleKind schedule_ = ScheduleKind::Cascade;
    std::vector<NodeGroup> grouping_;
    FidelityMetrics fidelity_;
    CorrectionSummary correction_;
    CorrelationMap correlations_;
    double composite_ = 0.0;
    std::vector<OutcomeCount> top_;
    std::string circuit_qasm_;
    std::string git_commit_;
    std::string build_time_;
    std::string digest_;
    AnchorFields anchor_;
};

// Lowercase hex SHA-256 of data.
std::string sha256_hex(const std::string& data);

// Local time as YYYY-MM-DDTHH:MM:SS.
std::string iso_timestamp_now();

class ReportAssembler {
public:
    /**
     * Range-checks every metric (std::logic_error on violation), classifies
     * the status, keeps the top outcomes and stamps the digest.
     * An empty timestamp means now.
     */
    static Report assemble(const std::string& run_label,
                           const TopologyDescriptor& topology,
                           std::int64_t shots,
                           const Circuit& measured,
                           const CountDistribution& counts,
                           const FidelityMetrics& fidelity,
                           const CorrectionSummary& correction,
                           const CorrelationMap& correlations,
                           double composite_index,
                           std::string timestamp = {});
};

} // namespace ghzbench

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/Report.hpp"
#include "core/ReportSink.hpp"
#include "core/RunConfig.hpp"
#include "core/RunHistory.hpp"
#include "net/AnchorClient.hpp"
#include "simulator/Simulator.hpp"
#include "toolkit/ICorrectionProvider.hpp"

namespace ghzbench {

struct RunOutcome {
    Report report;
    std::optional<std::string> persisted_path;
};

/**
 * @brief build -> simulate -> score -> assemble -> anchor -> persist.
 *
 * Collaborators are optional and injected. Exact-state failures fall
 * back to the theoretical fidelity; sampling failures propagate as
 * SimulationError and no report is produced. Anchoring is best-effort.
 */
class Pipeline {
public:
    Pipeline() = default;

    // Replaces the dense exact-state engine (sampling keeps its own).
    Pipeline& with_state_simulator(std::shared_ptr<StateSimulator> sim);
    Pipeline& with_correction(std::shared_ptr<ICorrectionProvider> provider);
    Pipeline& with_anchor(std::shared_ptr<IAnchorClient> client);
    Pipeline& with_sink(std::shared_ptr<ReportSink> sink);
    Pipeline& with_history(std::shared_ptr<RunHistory> history);

    // Wires the concrete collaborators named by the config's urls and paths.
    static Pipeline from_config(const RunConfig& cfg, bool persist);

    RunOutcome run(const RunConfig& cfg) const;

private:
    std::optional<StateVector> simulate_exact(const Circuit& exact, std::size_t max_qubits) const;
    std::optional<CorrectionResult> request_correction(const Circuit& exact, double exact_fidelity) const;
    Report anchor(const Report& report) const;

    std::shared_ptr<StateSimulator> state_sim_;
    std::shared_ptr<ICorrectionProvider> correction_;
    std::shared_ptr<IAnchorClient> anchor_;
    std::shared_ptr<ReportSink> sink_;
    std::shared_ptr<RunHistory> history_;
};

} // namespace ghzbench

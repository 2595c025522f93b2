#include "core/Pipeline.hpp"

#include "core/ErrorCatalog.hpp"
#include "core/Metrics.hpp"
#include "simulator/CircuitBuilder.hpp"
#include "toolkit/QecServiceCorrection.hpp"

#include <exception>
#include <iostream>
#include <thread>

namespace ghzbench {

Pipeline& Pipeline::with_state_simulator(std::shared_ptr<StateSimulator> sim) { state_sim_ = std::move(sim); return *this; }
Pipeline& Pipeline::with_correction(std::shared_ptr<ICorrectionProvider> provider) { correction_ = std::move(provider); return *this; }
Pipeline& Pipeline::with_anchor(std::shared_ptr<IAnchorClient> client) { anchor_ = std::move(client); return *this; }
Pipeline& Pipeline::with_sink(std::shared_ptr<ReportSink> sink) { sink_ = std::move(sink); return *this; }
Pipeline& Pipeline::with_history(std::shared_ptr<RunHistory> history) { history_ = std::move(history); return *this; }

Pipeline Pipeline::from_config(const RunConfig& cfg, bool persist) {
    Pipeline p;
    if (!cfg.correction_url.empty()) {
        p.with_correction(std::make_shared<QecServiceCorrection>(cfg.correction_url));
    }
    if (!cfg.anchor_url.empty()) {
        try {
            p.with_anchor(std::make_shared<LedgerAnchorClient>(cfg.anchor_url));
        } catch (const AnchorFailure& e) {
            std::cerr << "Pipeline: anchoring disabled: " << e.what() << std::endl;
        }
    }
    if (persist) {
        p.with_sink(std::make_shared<ReportSink>(cfg.reports_dir));
        p.with_history(std::make_shared<RunHistory>(cfg.history_path));
    }
    return p;
}

std::optional<StateVector> Pipeline::simulate_exact(const Circuit& exact, std::size_t max_qubits) const {
    try {
        if (state_sim_) return state_sim_->evolve(exact);
        DenseStateSimulator dense(max_qubits);
        return dense.evolve(exact);
    } catch (const SimulationError& e) {
        std::cerr << "Pipeline: exact simulation unavailable, using fallback fidelity "
                  << kFallbackExactFidelity << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<CorrectionResult> Pipeline::request_correction(const Circuit& exact, double exact_fidelity) const {
    if (!correction_) return std::nullopt;
    try {
        auto r = correction_->correct(exact, exact_fidelity);
        if (!r) std::cerr << "Pipeline: correction provider " << correction_->name() << " unavailable" << std::endl;
        return r;
    } catch (const std::exception& e) {
        std::cerr << "Pipeline: correction provider " << correction_->name() << " failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

Report Pipeline::anchor(const Report& report) const {
    if (!anchor_) return report;
    try {
        AnchorResult r = anchor_->submit(report.run_label(), report.anchor_payload());
        if (!r.success) {
            std::cerr << "Pipeline: anchor " << anchor_->name() << " did not accept entry: " << r.error << std::endl;
            return report;
        }
        std::cout << "Pipeline: anchored entry " << r.entry.entry_hash << std::endl;
        return report.with_anchor(r.entry);
    } catch (const std::exception& e) {
        std::cerr << "Pipeline: anchoring failed, report left un-anchored: " << e.what() << std::endl;
        return report;
    }
}

RunOutcome Pipeline::run(const RunConfig& cfg) const {
    const auto& topo = cfg.topology;
    CircuitBuilder builder(topo);
    const CircuitPair circuits = builder.build();
    std::cout << "Pipeline: " << cfg.label << " n=" << topo.num_qubits()
              << " schedule=" << to_string(topo.schedule())
              << " gates=" << circuits.measured.size() << " shots=" << cfg.shots << std::endl;

    Simulator sampler(cfg.seed, std::make_shared<DenseStateSimulator>(cfg.max_qubits));
    std::optional<StateVector> state;
    std::optional<CountDistribution> counts;

    if (cfg.parallel) {
        std::exception_ptr exact_error, sample_error;
        std::thread exact_worker([&]() {
            try {
                state = simulate_exact(circuits.exact, cfg.max_qubits);
            } catch (...) {
                exact_error = std::current_exception();
            }
        });
        std::thread sample_worker([&]() {
            try {
                counts = sampler.run(circuits.measured, cfg.shots);
            } catch (...) {
                sample_error = std::current_exception();
            }
        });
        exact_worker.join();
        sample_worker.join();
        if (sample_error) std::rethrow_exception(sample_error);
        if (exact_error) std::rethrow_exception(exact_error);
    } else {
        state = simulate_exact(circuits.exact, cfg.max_qubits);
        counts = sampler.run(circuits.measured, cfg.shots);
    }

    const FidelityMetrics fidelity = FidelityEstimator::estimate(state, *counts);
    const CorrectionSummary correction =
        FidelityEstimator::apply_correction(fidelity, request_correction(circuits.exact, fidelity.exact));
    const CorrelationMap correlations = CorrelationAnalyzer::analyze(*counts, topo.groups());
    const double composite = CompositeScorer::score(correction.fidelity_used, correlations);

    Report report = ReportAssembler::assemble(cfg.label, topo, cfg.shots, circuits.measured, *counts,
                                              fidelity, correction, correlations, composite);
    std::cout << "Pipeline: " << to_string(report.status()) << " fidelity=" << report.fidelity_used()
              << " composite=" << report.composite_index() << std::endl;

    report = anchor(report);

    RunOutcome out{report, std::nullopt};
    if (sink_) out.persisted_path = sink_->persist(out.report);
    if (history_) history_->append(out.report);
    return out;
}

} // namespace ghzbench

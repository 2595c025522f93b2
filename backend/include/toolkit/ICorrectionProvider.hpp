#pragma once
#include <optional>
#include <string>

#include "core/Metrics.hpp"
#include "simulator/Circuit.hpp"

namespace ghzbench {

/**
 * @brief Abstract interface for external error-correction services (plugins).
 * A provider that cannot be reached returns std::nullopt; it never fails the run.
 */
class ICorrectionProvider {
public:
    virtual ~ICorrectionProvider() = default;
    /** @brief Provider name (for logging) */
    virtual std::string name() const = 0;
    /** @brief Correct the exact fidelity of a measurement-free circuit */
    virtual std::optional<CorrectionResult> correct(const Circuit& circuit, double exact_fidelity) = 0;
};

} // namespace ghzbench

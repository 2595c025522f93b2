#pragma once
#include <string>

#include "toolkit/ICorrectionProvider.hpp"

namespace ghzbench {

// HTTP client for a QEC service exposing POST <base>/api/qec/correct.
class QecServiceCorrection : public ICorrectionProvider {
public:
    explicit QecServiceCorrection(std::string base_url, long timeout_ms = 5000);

    std::string name() const override { return "qec_service"; }
    std::optional<CorrectionResult> correct(const Circuit& circuit, double exact_fidelity) override;

    // Parses a service reply; std::nullopt if it is not a usable correction.
    static std::optional<CorrectionResult> parse_response(const std::string& body);

private:
    std::string base_url_;
    long timeout_ms_;
};

} // namespace ghzbench

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ghzbench::errors {

// 3100-3199: simulation errors
// 3200-3299: configuration / topology errors
// 3300-3399: collaborator (anchor, correction, persistence) errors

inline constexpr const char* MSG_E3100_SIMULATION_FAILED_PREFIX = "Error 3100: Simulation failed: ";
inline constexpr const char* MSG_E3200_CONFIG_REJECTED_PREFIX = "Error 3200: Configuration rejected: ";
inline constexpr const char* MSG_E3300_ANCHOR_FAILED_PREFIX = "Error 3300: Anchoring failed: ";
inline constexpr const char* MSG_E3310_PERSIST_FAILED_PREFIX = "Error 3310: Report persistence failed: ";

// E3100 details.
inline constexpr const char* D3100_SHOTS_NOT_POSITIVE = "shot count must be > 0";
inline constexpr const char* D3100_REGISTER_TOO_LARGE = "register exceeds dense simulator capacity";
inline constexpr const char* D3100_REGISTER_EMPTY = "register has no qubits";
inline constexpr const char* D3100_QUBIT_OUT_OF_RANGE = "gate targets qubit outside register";
inline constexpr const char* D3100_MALFORMED_GATE = "gate has wrong number of targets";
inline constexpr const char* D3100_NORM_DIVERGED = "state norm diverged";
inline constexpr const char* D3100_NOT_MEASURED = "circuit has no measurement marker";
inline constexpr const char* D3100_ALLOCATION_FAILED = "state vector allocation failed";

// E3200 details.
inline constexpr const char* D3200_QUBITS_OUT_OF_RANGE = "qubit count out of range";
inline constexpr const char* D3200_UNKNOWN_SCHEDULE = "unknown schedule kind";
inline constexpr const char* D3200_NO_GROUPS = "grouping scheme is empty";
inline constexpr const char* D3200_EMPTY_GROUP = "group has no qubits";
inline constexpr const char* D3200_GROUP_INDEX_OUT_OF_RANGE = "group qubit index outside register";
inline constexpr const char* D3200_GROUPS_OVERLAP = "groups are not disjoint";
inline constexpr const char* D3200_GROUP_SIZE_NOT_UNIFORM = "group sizes are not uniform";
inline constexpr const char* D3200_DUPLICATE_NODE = "duplicate node name";
inline constexpr const char* D3200_GROUP_SIZE_INVALID = "group_size must be > 0 and all groups must fit the register";
inline constexpr const char* D3200_UNKNOWN_PRESET = "unknown preset";
inline constexpr const char* D3200_CONFIG_NOT_OBJECT = "config must be a JSON object";
inline constexpr const char* D3200_NODE_NOT_OBJECT = "each nodes entry must be a JSON object";
inline constexpr const char* D3200_CONFIG_OPEN_FAILED = "unable to open config file";

// E3300 / E3310 details.
inline constexpr const char* D3300_BAD_URL = "anchor url must be ws://host:port/path";
inline constexpr const char* D3300_TIMEOUT = "ledger rpc timed out";
inline constexpr const char* D3300_REJECTED = "ledger rejected entry";
inline constexpr const char* D3300_MISSING_HASH = "ledger response missing entry_hash";
inline constexpr const char* D3310_OPEN_FILE_FAILED = "failed to open report file";
inline constexpr const char* D3310_OPEN_HISTORY_FAILED = "failed to open history log";

inline std::string format_with_prefix(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

inline std::string format_E3100_simulation_failed(std::string_view detail) {
    return format_with_prefix(MSG_E3100_SIMULATION_FAILED_PREFIX, detail);
}

inline std::string format_E3200_config_rejected(std::string_view detail) {
    return format_with_prefix(MSG_E3200_CONFIG_REJECTED_PREFIX, detail);
}

inline std::string format_E3300_anchor_failed(std::string_view detail) {
    return format_with_prefix(MSG_E3300_ANCHOR_FAILED_PREFIX, detail);
}

inline std::string format_E3310_persist_failed(std::string_view detail) {
    return format_with_prefix(MSG_E3310_PERSIST_FAILED_PREFIX, detail);
}

} // namespace ghzbench::errors

namespace ghzbench {

/**
 * @brief Raised when a simulation step cannot produce a valid result.
 *
 * Exact-state failures are recovered by the fidelity estimator; sampling
 * failures abort the run.
 */
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(std::string_view detail)
        : std::runtime_error(errors::format_E3100_simulation_failed(detail)) {}
};

/** @brief Raised by anchor clients; the pipeline treats it as best-effort. */
class AnchorFailure : public std::runtime_error {
public:
    explicit AnchorFailure(std::string_view detail)
        : std::runtime_error(errors::format_E3300_anchor_failed(detail)) {}
};

} // namespace ghzbench

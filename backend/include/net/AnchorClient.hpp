#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/ErrorCatalog.hpp"

namespace ghzbench {

struct AnchorEntry {
    std::string entry_hash;
    std::optional<std::string> ots_proof;
};

struct AnchorResult {
    bool success = false;
    AnchorEntry entry;
    std::string error;   // set when success is false
};

/**
 * @brief Submits a report digest to an append-only external ledger.
 *
 * submit() may throw AnchorFailure; callers treat anchoring as best-effort.
 */
class IAnchorClient {
public:
    virtual ~IAnchorClient() = default;
    virtual std::string name() const = 0;
    virtual AnchorResult submit(const std::string& run_label, const nlohmann::json& payload) = 0;
};

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

// Minimal parser for ws://host:port/path
bool parse_ws_url(const std::string& url, WsUrl& out);

// WebSocket RPC client calling "ledger.append" on the ledger service.
class LedgerAnchorClient : public IAnchorClient {
public:
    // Throws AnchorFailure if the url is not ws://host:port/path.
    explicit LedgerAnchorClient(std::string ws_url, int timeout_ms = 10000);

    std::string name() const override { return "ledger"; }
    AnchorResult submit(const std::string& run_label, const nlohmann::json& payload) override;

    // Maps an rpc_result message to an AnchorResult.
    static AnchorResult parse_rpc_result(const nlohmann::json& msg);

private:
    nlohmann::json rpc(const std::string& method, const nlohmann::json& params) const;

    std::string ws_url_;
    WsUrl url_;
    int timeout_ms_;
};

} // namespace ghzbench

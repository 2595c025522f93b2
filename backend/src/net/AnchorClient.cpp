#include "net/AnchorClient.hpp"
#include "core/ErrorCatalog.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <random>

namespace ghzbench {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

std::string random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (int i = 0; i < 32; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

} // namespace

bool parse_ws_url(const std::string& url, WsUrl& out) {
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "80";
    }
    return !out.host.empty();
}

LedgerAnchorClient::LedgerAnchorClient(std::string ws_url, int timeout_ms)
: ws_url_(std::move(ws_url)), timeout_ms_(timeout_ms) {
    if (!parse_ws_url(ws_url_, url_)) {
        throw AnchorFailure(std::string(errors::D3300_BAD_URL) + ": " + ws_url_);
    }
}

json LedgerAnchorClient::rpc(const std::string& method, const json& params) const {
    net::io_context ioc;
    tcp::resolver resolver{ioc};
    websocket::stream<beast::tcp_stream> ws{ioc};

    // The deadline bounds the whole call.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    beast::error_code ec;
    bool done = false;
    auto on_done = [&](beast::error_code e, auto&&...) {
        ec = e;
        done = true;
    };
    auto await = [&](const char* step) {
        done = false;
        ioc.restart();
        while (!done && ioc.run_one_until(deadline) != 0) {}
        if (!done || ec == beast::error::timeout) {
            throw AnchorFailure(std::string(errors::D3300_TIMEOUT) + " during " + step + ": " + method);
        }
        if (ec) throw AnchorFailure(ws_url_ + ": " + step + ": " + ec.message());
    };

    tcp::resolver::results_type results;
    resolver.async_resolve(url_.host, url_.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
            done = true;
        });
    await("resolve");

    beast::get_lowest_layer(ws).expires_at(deadline);
    beast::get_lowest_layer(ws).async_connect(results, on_done);
    await("connect");

    // The websocket stream manages its own timers once the socket is up.
    beast::get_lowest_layer(ws).expires_never();
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::milliseconds(timeout_ms_);
    opt.idle_timeout = websocket::stream_base::none();
    opt.keep_alive_pings = false;
    ws.set_option(opt);

    ws.async_handshake(url_.host + ":" + url_.port, url_.target, on_done);
    await("handshake");

    const std::string id = std::string("ghz_") + random_id();
    const std::string req = json{{"type", "rpc"}, {"id", id}, {"method", method}, {"params", params}}.dump();
    ws.async_write(net::buffer(req), on_done);
    await("write");

    beast::flat_buffer buffer;
    for (;;) {
        buffer.consume(buffer.size());
        ws.async_read(buffer, on_done);
        await("read");
        std::string data = beast::buffers_to_string(buffer.data());

        json msg = json::parse(data, nullptr, false);
        if (!msg.is_object()) continue;
        if (msg.value("type", std::string{}) == "rpc_result" && msg.value("id", std::string{}) == id) {
            // Best-effort close; the reply is already in hand.
            bool closed = false;
            ws.async_close(websocket::close_code::normal, [&](beast::error_code) { closed = true; });
            ioc.restart();
            while (!closed && ioc.run_one_until(deadline) != 0) {}
            return msg;
        }
    }
}

AnchorResult LedgerAnchorClient::parse_rpc_result(const json& msg) {
    AnchorResult r;
    if (!msg.value("ok", false)) {
        r.success = false;
        r.error = std::string(errors::D3300_REJECTED) + ": " + msg.value("error", json{}).dump();
        return r;
    }
    const json result = msg.value("result", json::object());
    if (!result.is_object() || !result.contains("entry_hash") || !result["entry_hash"].is_string()) {
        throw AnchorFailure(errors::D3300_MISSING_HASH);
    }
    r.success = true;
    r.entry.entry_hash = result["entry_hash"].get<std::string>();
    if (result.contains("ots_proof") && result["ots_proof"].is_string()) {
        r.entry.ots_proof = result["ots_proof"].get<std::string>();
    }
    return r;
}

AnchorResult LedgerAnchorClient::submit(const std::string& run_label, const json& payload) {
    json msg;
    try {
        msg = rpc("ledger.append", json{{"label", run_label}, {"payload", payload}});
    } catch (const AnchorFailure&) {
        throw;
    } catch (const std::exception& e) {
        // resolver / connect / handshake errors from Asio and Beast
        throw AnchorFailure(std::string(ws_url_) + ": " + e.what());
    }
    return parse_rpc_result(msg);
}

} // namespace ghzbench

#include <gtest/gtest.h>
#include "core/Report.hpp"
#include "core/ReportSink.hpp"
#include "core/RunHistory.hpp"
#include "net/AnchorClient.hpp"
#include "simulator/CircuitBuilder.hpp"
#include "toolkit/QecServiceCorrection.hpp"
#include <nlohmann/json.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <thread>

using nlohmann::json;
using namespace ghzbench;

namespace {

struct Fixture {
    TopologyDescriptor topo = TopologyDescriptor::uniform(6, 3, {"CERN", "NASA"}, ScheduleKind::Cascade);
    Circuit measured = CircuitBuilder(topo).build_measured();
    CountDistribution counts{6, {{0, 50}, {63, 40}, {7, 6}, {56, 4}}};
};

Report make_report(double fidelity_used, const std::string& label = "unit") {
    Fixture f;
    FidelityMetrics m{1.0, 0.9, false};
    CorrectionSummary c;
    c.fidelity_used = fidelity_used;
    CorrelationMap corr = CorrelationAnalyzer::analyze(f.counts, f.topo.groups());
    double composite = CompositeScorer::score(fidelity_used, corr);
    return ReportAssembler::assemble(label, f.topo, 100, f.measured, f.counts, m, c, corr, composite,
                                     "2026-01-01T00:00:00");
}

std::filesystem::path fresh_dir(const std::string& name) {
    auto p = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(p);
    return p;
}

} // namespace

TEST(Report, StatusThreshold) {
    EXPECT_EQ(make_report(0.97).status(), RunStatus::Complete);
    EXPECT_EQ(make_report(0.9699).status(), RunStatus::Failed);
}

TEST(Report, SchemaFields) {
    json j = make_report(1.0).to_json();
    for (const char* key : {"schema_version", "run_label", "timestamp", "status", "qubits", "shots", "schedule",
                            "grouping", "fidelity", "correction", "node_correlations", "composite_index",
                            "top_outcomes", "circuit_qasm", "build", "digest", "anchor"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["status"], "COMPLETE");
    EXPECT_EQ(j["schedule"], "cascade");
    EXPECT_EQ(j["fidelity"]["theoretical_baseline"], 1.0);
    EXPECT_EQ(j["fidelity"]["exact_fallback"], false);
    EXPECT_EQ(j["correction"]["applied"], false);
    EXPECT_DOUBLE_EQ(j["node_correlations"]["CERN"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(j["node_correlations"]["NASA"].get<double>(), 1.0);
    EXPECT_EQ(j["top_outcomes"][0]["bitstring"], "000000");
    EXPECT_EQ(j["top_outcomes"][0]["count"], 50);
    EXPECT_EQ(j["top_outcomes"][1]["bitstring"], "111111");
    EXPECT_EQ(j["top_outcomes"].size(), 4u);
    EXPECT_EQ(j["anchor"]["anchored"], false);
    EXPECT_TRUE(j["anchor"]["entry_hash"].is_null());
    EXPECT_NE(j["circuit_qasm"].get<std::string>().find("OPENQASM 2.0;"), std::string::npos);
}

TEST(Report, DigestCoversUnanchoredContent) {
    Report r = make_report(1.0);
    EXPECT_EQ(r.digest().size(), 64u);
    EXPECT_EQ(r.digest(), sha256_hex(r.digest_source().dump()));
    EXPECT_EQ(r.digest(), make_report(1.0).digest());
    EXPECT_NE(r.digest(), make_report(1.0, "other").digest());
}

TEST(Report, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Report, AnchoringOnlyTouchesAnchorFields) {
    Report r = make_report(0.99);
    AnchorEntry e{"entryhash123", std::string("proof")};
    Report a = r.with_anchor(e);

    EXPECT_FALSE(r.anchor().anchored);
    EXPECT_TRUE(a.anchor().anchored);
    EXPECT_EQ(*a.anchor().entry_hash, "entryhash123");
    EXPECT_EQ(*a.anchor().ots_proof, "proof");

    json before = r.to_json();
    json after = a.to_json();
    before.erase("anchor");
    after.erase("anchor");
    EXPECT_EQ(before, after);
    EXPECT_THROW(r.with_anchor(AnchorEntry{}), std::invalid_argument);
}

TEST(Report, AssemblerRejectsInconsistentInputs) {
    Fixture f;
    FidelityMetrics m{1.0, 0.9, false};
    CorrectionSummary c;
    c.fidelity_used = 1.0;
    CorrelationMap corr = CorrelationAnalyzer::analyze(f.counts, f.topo.groups());
    EXPECT_THROW(ReportAssembler::assemble("x", f.topo, 99, f.measured, f.counts, m, c, corr, 0.5), std::logic_error);
    EXPECT_THROW(ReportAssembler::assemble("x", f.topo, 100, f.measured, f.counts, m, c, corr, 1.2), std::logic_error);
    CorrelationMap partial = { corr[0] };
    EXPECT_THROW(ReportAssembler::assemble("x", f.topo, 100, f.measured, f.counts, m, c, partial, 0.5), std::logic_error);
}

TEST(ReportSink, WritesDatedJson) {
    auto dir = fresh_dir("ghzbench_sink_test");
    ReportSink sink(dir.string());
    std::string path = sink.persist(make_report(1.0, "qip 2/run"));

    std::filesystem::path p(path);
    ASSERT_TRUE(std::filesystem::exists(p));
    EXPECT_EQ(p.parent_path().parent_path(), dir);
    EXPECT_EQ(p.parent_path().filename().string().size(), 10u);   // YYYY-MM-DD
    EXPECT_EQ(p.filename().string().rfind("qip_2_run_", 0), 0u);
    EXPECT_EQ(p.extension().string(), ".json");

    std::ifstream f(p);
    json j = json::parse(f);
    EXPECT_EQ(j["run_label"], "qip 2/run");
}

TEST(ReportSink, Sanitize) {
    EXPECT_EQ(ReportSink::sanitize("a b/c.d-e"), "a_b_c.d-e");
    EXPECT_EQ(ReportSink::sanitize(""), "report");
}

TEST(RunHistory, AppendLoadSummary) {
    auto dir = fresh_dir("ghzbench_history_test");
    auto path = (dir / "history.jsonl").string();
    RunHistory history(path);
    history.append(make_report(1.0, "first"));
    history.append(make_report(0.5, "second").with_anchor(AnchorEntry{"h2", std::nullopt}));

    {
        std::ofstream f(path, std::ios::app);
        f << "{not json\n";
    }

    std::ifstream f(path);
    std::string header;
    std::getline(f, header);
    EXPECT_EQ(json::parse(header)["type"], "ghzbench_history");

    auto entries = history.load();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].label, "first");
    EXPECT_EQ(entries[0].status, "COMPLETE");
    EXPECT_FALSE(entries[0].entry_hash.has_value());
    EXPECT_EQ(entries[1].status, "FAILED");
    EXPECT_EQ(*entries[1].entry_hash, "h2");

    auto s = history.summary();
    EXPECT_EQ(s.runs, 2u);
    EXPECT_EQ(s.complete, 1u);
    EXPECT_EQ(s.best_label, "first");
    EXPECT_DOUBLE_EQ(s.mean_composite, (entries[0].composite_index + entries[1].composite_index) / 2.0);
}

TEST(RunHistory, MissingFileLoadsEmpty) {
    EXPECT_TRUE(RunHistory::load("/nonexistent/ghzbench/history.jsonl").empty());
    EXPECT_EQ(RunHistory::summarize({}).runs, 0u);
}

TEST(QecServiceCorrection, ParsesServiceReply) {
    auto r = QecServiceCorrection::parse_response(R"({"fidelity":0.991,"stability":0.97,"error_rate":0.02})");
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r->fidelity, 0.991);
    EXPECT_DOUBLE_EQ(r->stability, 0.97);

    auto partial = QecServiceCorrection::parse_response(R"({"stability":0.9})");
    ASSERT_TRUE(partial.has_value());
    EXPECT_FALSE(partial->fidelity.has_value());
    EXPECT_DOUBLE_EQ(partial->error_rate, kDefaultErrorRate);

    EXPECT_FALSE(QecServiceCorrection::parse_response("<html>").has_value());
    EXPECT_FALSE(QecServiceCorrection::parse_response(R"({"fidelity":3.0})").has_value());
}

TEST(QecServiceCorrection, UnreachableServiceIsUnavailable) {
    QecServiceCorrection svc("http://127.0.0.1:1", 500);
    Circuit c(2);
    EXPECT_FALSE(svc.correct(c, 1.0).has_value());
}

TEST(LedgerAnchorClient, ParsesRpcResult) {
    json ok = {{"type", "rpc_result"}, {"id", "x"}, {"ok", true},
               {"result", {{"entry_hash", "abc"}, {"ots_proof", "p"}}}};
    auto r = LedgerAnchorClient::parse_rpc_result(ok);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.entry.entry_hash, "abc");
    EXPECT_EQ(*r.entry.ots_proof, "p");

    json rejected = {{"type", "rpc_result"}, {"ok", false}, {"error", "full"}};
    EXPECT_FALSE(LedgerAnchorClient::parse_rpc_result(rejected).success);

    json no_hash = {{"type", "rpc_result"}, {"ok", true}, {"result", json::object()}};
    EXPECT_THROW(LedgerAnchorClient::parse_rpc_result(no_hash), AnchorFailure);
}

TEST(LedgerAnchorClient, UrlValidation) {
    WsUrl u;
    ASSERT_TRUE(parse_ws_url("ws://ledger:9000/rpc", u));
    EXPECT_EQ(u.host, "ledger");
    EXPECT_EQ(u.port, "9000");
    EXPECT_EQ(u.target, "/rpc");
    ASSERT_TRUE(parse_ws_url("ws://ledger", u));
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/");
    EXPECT_THROW(LedgerAnchorClient("http://ledger"), AnchorFailure);
}

TEST(LedgerAnchorClient, UnreachableLedgerThrowsAnchorFailure) {
    LedgerAnchorClient client("ws://127.0.0.1:1/ledger", 500);
    EXPECT_THROW(client.submit("unit", json{{"digest", "00"}}), AnchorFailure);
}

namespace {

namespace net = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

// Loopback ledger that accepts one websocket session. With a reply it answers
// the first rpc; without one it holds the session open until released.
class LoopbackLedger {
public:
    explicit LoopbackLedger(bool reply)
    : acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0)),
      released_(release_.get_future()) {
        thread_ = std::thread([this, reply] { serve(reply); });
    }

    ~LoopbackLedger() {
        release_.set_value();
        thread_.join();
    }

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/ledger";
    }

private:
    void serve(bool reply) {
        try {
            tcp::socket sock(ioc_);
            acceptor_.accept(sock);
            websocket::stream<tcp::socket> ws(std::move(sock));
            ws.accept();
            if (reply) {
                boost::beast::flat_buffer buf;
                ws.read(buf);
                json req = json::parse(boost::beast::buffers_to_string(buf.data()));
                json res = {{"type", "rpc_result"}, {"id", req["id"]}, {"ok", true},
                            {"result", {{"entry_hash", "abc123"}}}};
                ws.write(net::buffer(res.dump()));
                // Answer the client's close frame.
                boost::beast::error_code ec;
                ws.read(buf, ec);
            }
            released_.wait();
        } catch (const std::exception& e) {
            // client hung up first
            std::cerr << "LoopbackLedger: " << e.what() << std::endl;
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::promise<void> release_;
    std::future<void> released_;
    std::thread thread_;
};

} // namespace

TEST(LedgerAnchorClient, SilentLedgerTimesOut) {
    LoopbackLedger ledger(false);
    LedgerAnchorClient client(ledger.url(), 300);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client.submit("unit", json{{"digest", "00"}}), AnchorFailure);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST(LedgerAnchorClient, ReplyingLedgerAnchors) {
    LoopbackLedger ledger(true);
    LedgerAnchorClient client(ledger.url(), 2000);
    AnchorResult r = client.submit("unit", json{{"digest", "00"}});
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.entry.entry_hash, "abc123");
    EXPECT_FALSE(r.entry.ots_proof.has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

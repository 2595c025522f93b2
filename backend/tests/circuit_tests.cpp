#include <gtest/gtest.h>
#include "simulator/Circuit.hpp"
#include "simulator/CircuitBuilder.hpp"
#include "core/Topology.hpp"

using namespace ghzbench;

static TopologyDescriptor four_nodes(ScheduleKind kind) {
    return TopologyDescriptor::uniform(12, 3, {"CERN", "NASA", "xAI", "Starlink"}, kind);
}

TEST(CircuitBuilder, CascadeIsHadamardThenChain) {
    CircuitBuilder b(four_nodes(ScheduleKind::Cascade));
    auto pair = b.build();
    const auto& g = pair.exact.gates();
    ASSERT_EQ(g.size(), 12u);
    EXPECT_EQ(g[0].kind, GateKind::H);
    EXPECT_EQ(g[0].qubits, (std::vector<std::size_t>{0}));
    for (std::size_t i = 1; i < g.size(); ++i) {
        EXPECT_EQ(g[i].kind, GateKind::CNOT);
        EXPECT_EQ(g[i].qubits, (std::vector<std::size_t>{i - 1, i}));
    }
}

TEST(CircuitBuilder, MeasuredVariantEndsWithBarrierAndMeasure) {
    CircuitBuilder b(four_nodes(ScheduleKind::Cascade));
    auto pair = b.build();
    ASSERT_TRUE(pair.measured.is_measured());
    EXPECT_FALSE(pair.exact.is_measured());
    const auto& g = pair.measured.gates();
    ASSERT_GE(g.size(), 2u);
    EXPECT_EQ(g[g.size() - 2].kind, GateKind::BARRIER);
    EXPECT_EQ(g.back().kind, GateKind::MEASURE);
    EXPECT_EQ(pair.measured.without_markers().size(), pair.exact.size());
}

TEST(CircuitBuilder, GroupedSeedStarsAndLinks) {
    CircuitBuilder b(four_nodes(ScheduleKind::GroupedSeed));
    Circuit c = b.build().exact;
    EXPECT_EQ(c.count(GateKind::H), 4u);
    // 2 star CNOTs per group + 3 links.
    EXPECT_EQ(c.count(GateKind::CNOT), 11u);
    const auto& g = c.gates();
    EXPECT_EQ(g[0].qubits, (std::vector<std::size_t>{0}));
    EXPECT_EQ(g[1].qubits, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(g[2].qubits, (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(g[g.size() - 3].qubits, (std::vector<std::size_t>{2, 3}));
    EXPECT_EQ(g.back().qubits, (std::vector<std::size_t>{8, 9}));
}

TEST(CircuitBuilder, VariationalLayerAddsRotations) {
    CircuitBuilder b(four_nodes(ScheduleKind::GroupedSeedVariational));
    Circuit c = b.build().exact;
    EXPECT_EQ(c.count(GateKind::RY), 12u);
    EXPECT_EQ(c.count(GateKind::CNOT), 11u + 6u);
    for (const auto& g : c.gates()) {
        if (g.kind == GateKind::RY) EXPECT_DOUBLE_EQ(g.angle, kVariationalAngle);
    }
}

TEST(CircuitBuilder, IsDeterministic) {
    auto topo = four_nodes(ScheduleKind::GroupedSeedVariational);
    EXPECT_EQ(CircuitBuilder(topo).build_measured().to_qasm(), CircuitBuilder(topo).build_measured().to_qasm());
}

TEST(Circuit, QasmRendering) {
    auto topo = TopologyDescriptor::uniform(3, 3, {"solo"}, ScheduleKind::Cascade);
    std::string qasm = CircuitBuilder(topo).build_measured().to_qasm();
    const std::string expected =
        "OPENQASM 2.0;\n"
        "include \"qelib1.inc\";\n"
        "qreg q[3];\n"
        "creg meas[3];\n"
        "h q[0];\n"
        "cx q[0],q[1];\n"
        "cx q[1],q[2];\n"
        "barrier q;\n"
        "measure q[0] -> meas[0];\n"
        "measure q[1] -> meas[1];\n"
        "measure q[2] -> meas[2];\n";
    EXPECT_EQ(qasm, expected);
}

TEST(Circuit, QasmOmitsCregWithoutMeasurement) {
    Circuit c(2);
    c.append({GateKind::RY, {1}, 0.5});
    std::string qasm = c.to_qasm();
    EXPECT_EQ(qasm.find("creg"), std::string::npos);
    EXPECT_NE(qasm.find("ry(0.5) q[1];"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

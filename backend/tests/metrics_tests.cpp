#include <gtest/gtest.h>
#include "core/Metrics.hpp"
#include "simulator/CircuitBuilder.hpp"
#include "simulator/Simulator.hpp"

using namespace ghzbench;

static std::vector<NodeGroup> two_groups() {
    return { {"A", {0, 1}}, {"B", {2, 3}} };
}

TEST(FidelityEstimator, ExactFromAmplitudesRawFromCounts) {
    auto topo = TopologyDescriptor::uniform(4, 2, {"A", "B"}, ScheduleKind::Cascade);
    auto pair = CircuitBuilder(topo).build();
    std::optional<StateVector> sv = DenseStateSimulator().evolve(pair.exact);
    CountDistribution counts(4, {{0, 40}, {15, 50}, {5, 10}});

    auto m = FidelityEstimator::estimate(sv, counts);
    EXPECT_NEAR(m.exact, 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(m.raw, 0.9);
    EXPECT_FALSE(m.exact_fallback);
}

TEST(FidelityEstimator, MissingStateFallsBack) {
    CountDistribution counts(3, {{0, 1}, {7, 1}});
    auto m = FidelityEstimator::estimate(std::nullopt, counts);
    EXPECT_DOUBLE_EQ(m.exact, kFallbackExactFidelity);
    EXPECT_TRUE(m.exact_fallback);
    EXPECT_DOUBLE_EQ(m.raw, 1.0);
}

TEST(FidelityEstimator, CorrectionDefaultsWhenUnavailable) {
    FidelityMetrics m{0.8, 0.7, false};
    auto s = FidelityEstimator::apply_correction(m, std::nullopt);
    EXPECT_FALSE(s.applied);
    EXPECT_DOUBLE_EQ(s.fidelity_used, 0.8);
    EXPECT_DOUBLE_EQ(s.stability, 0.95);
    EXPECT_DOUBLE_EQ(s.error_rate, 0.05);
}

TEST(FidelityEstimator, CorrectionReplacesFidelity) {
    FidelityMetrics m{0.8, 0.7, false};
    CorrectionResult c;
    c.fidelity = 0.99;
    c.stability = 0.9;
    c.error_rate = 0.01;
    auto s = FidelityEstimator::apply_correction(m, c);
    EXPECT_TRUE(s.applied);
    EXPECT_DOUBLE_EQ(s.fidelity_used, 0.99);
    EXPECT_DOUBLE_EQ(s.error_rate, 0.01);

    CorrectionResult metrics_only;
    auto s2 = FidelityEstimator::apply_correction(m, metrics_only);
    EXPECT_TRUE(s2.applied);
    EXPECT_DOUBLE_EQ(s2.fidelity_used, 0.8);
}

TEST(FidelityEstimator, OutOfRangeFailsLoudly) {
    FidelityMetrics m{0.8, 0.7, false};
    CorrectionResult c;
    c.fidelity = 1.5;
    EXPECT_THROW(FidelityEstimator::apply_correction(m, c), std::logic_error);
    EXPECT_THROW(require_unit_range("x", -0.1), std::logic_error);
    EXPECT_DOUBLE_EQ(require_unit_range("x", 1.0), 1.0);
}

TEST(CorrelationAnalyzer, UniformSubstringsCount) {
    // 4 qubits, indices little-endian: 0b0011 has group A = 11, group B = 00.
    CountDistribution counts(4, {{0b0011, 30}, {0b0110, 20}, {0b1111, 50}});
    auto map = CorrelationAnalyzer::analyze(counts, two_groups());
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map[0].first, "A");
    EXPECT_DOUBLE_EQ(map[0].second, 0.8);
    EXPECT_EQ(map[1].first, "B");
    EXPECT_DOUBLE_EQ(map[1].second, 0.8);
}

TEST(CorrelationAnalyzer, FullyCorrelatedIsExactlyOne) {
    CountDistribution counts(4, {{0b0000, 1023}, {0b1111, 1025}});
    for (const auto& [node, v] : CorrelationAnalyzer::analyze(counts, two_groups())) {
        EXPECT_EQ(v, 1.0) << node;
    }
}

TEST(CorrelationAnalyzer, NoQualifyingOutcomeIsZero) {
    CountDistribution counts(4, {{0b0101, 10}, {0b1010, 10}});
    for (const auto& [node, v] : CorrelationAnalyzer::analyze(counts, two_groups())) {
        EXPECT_EQ(v, 0.0) << node;
    }
}

TEST(CorrelationAnalyzer, NonContiguousGroups) {
    std::vector<NodeGroup> groups = { {"even", {0, 2}}, {"odd", {1, 3}} };
    CountDistribution counts(4, {{0b0101, 6}, {0b0001, 4}});
    auto map = CorrelationAnalyzer::analyze(counts, groups);
    EXPECT_DOUBLE_EQ(map[0].second, 0.6);
    EXPECT_DOUBLE_EQ(map[1].second, 1.0);
}

TEST(CompositeScorer, MeanOfFidelityAndCorrelation) {
    CorrelationMap map = { {"A", 0.5}, {"B", 1.0} };
    EXPECT_DOUBLE_EQ(CompositeScorer::score(1.0, map), 0.875);
}

TEST(CompositeScorer, MonotoneInBothInputs) {
    CorrelationMap lo = { {"A", 0.2}, {"B", 0.4} };
    CorrelationMap hi = { {"A", 0.3}, {"B", 0.4} };
    double prev = -1.0;
    for (double f = 0.0; f <= 1.0; f += 0.125) {
        const double s = CompositeScorer::score(f, lo);
        EXPECT_GE(s, prev);
        EXPECT_GE(CompositeScorer::score(f, hi), s);
        prev = s;
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "modules/BarrierScorer.h"
#include <cmath>
#include <memory>

namespace {

EdgeMetrics edge(double geoKm, double genetic) {
    EdgeMetrics e;
    e.geoDistanceKm = geoKm;
    e.geneticDistance = genetic;
    return e;
}

// Ten flat edges 100..190 km plus one odd edge at 145 km
std::vector<EdgeMetrics> flatWithOddEdge(double oddGenetic) {
    std::vector<EdgeMetrics> edges;
    for (int i = 0; i < 10; ++i) {
        edges.push_back(edge(100.0 + 10.0 * i, 0.2));
    }
    edges.push_back(edge(145.0, oddGenetic));
    return edges;
}

ScoringParams testParams() {
    ScoringParams p;
    p.bandwidth = 2.0 / 3.0;
    p.barrierThreshold = 1.5;
    p.corridorThreshold = 0.5;
    p.robustIterations = 3;
    return p;
}

// Curve that is zero everywhere, for the neutral fallback path
class ZeroCurve : public CurveSmoother {
public:
    bool fit(const std::vector<double>& xs, const std::vector<double>&) override {
        fitted_ = xs.size() >= 2;
        return fitted_;
    }
    std::optional<double> evaluate(double) const override { return 0.0; }
    bool fitted() const override { return fitted_; }
    std::vector<std::pair<double, double>> curve() const override { return {}; }

private:
    bool fitted_ = false;
};

}

TEST(BarrierScorerTest, ClassificationRule) {
    BarrierScorer scorer(ScoringParams{});
    EXPECT_EQ(scorer.classify(1.5), EdgeClass::Barrier);
    EXPECT_EQ(scorer.classify(3.0), EdgeClass::Barrier);
    EXPECT_EQ(scorer.classify(0.67), EdgeClass::Corridor);
    EXPECT_EQ(scorer.classify(0.1), EdgeClass::Corridor);
    EXPECT_EQ(scorer.classify(1.0), EdgeClass::Normal);
    EXPECT_EQ(scorer.classify(1.49), EdgeClass::Normal);
    EXPECT_EQ(scorer.classify(0.68), EdgeClass::Normal);
}

TEST(BarrierScorerTest, RejectsThresholdsOutsideTheirDomain) {
    ScoringParams p;
    p.barrierThreshold = 1.0;
    EXPECT_THROW(BarrierScorer{p}, ConfigurationError);

    p = ScoringParams{};
    p.corridorThreshold = 1.0;
    EXPECT_THROW(BarrierScorer{p}, ConfigurationError);

    p = ScoringParams{};
    p.corridorThreshold = 0.0;
    EXPECT_THROW(BarrierScorer{p}, ConfigurationError);

    p = ScoringParams{};
    p.bandwidth = 0.0;
    EXPECT_THROW(BarrierScorer{p}, ConfigurationError);
}

// An edge far above the trend is a barrier; its neighbors stay normal
TEST(BarrierScorerTest, FlagsBarrier) {
    auto edges = flatWithOddEdge(0.8);
    BarrierScorer scorer(testParams());
    FitSummary fit = scorer.score(edges);

    ASSERT_TRUE(fit.fitted);
    EXPECT_EQ(fit.trainingSize, 11u);
    EXPECT_EQ(fit.barriers, 1u);
    EXPECT_EQ(fit.corridors, 0u);
    EXPECT_EQ(fit.normal, 10u);

    EXPECT_EQ(edges.back().classification, EdgeClass::Barrier);
    EXPECT_NEAR(edges.back().scaledDistance, 4.0, 1e-6);
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        EXPECT_EQ(edges[i].classification, EdgeClass::Normal);
        EXPECT_NEAR(edges[i].scaledDistance, 1.0, 1e-6);
    }
}

// An edge far below the trend is a corridor
TEST(BarrierScorerTest, FlagsCorridor) {
    auto edges = flatWithOddEdge(0.05);
    BarrierScorer scorer(testParams());
    FitSummary fit = scorer.score(edges);

    ASSERT_TRUE(fit.fitted);
    EXPECT_EQ(fit.corridors, 1u);
    EXPECT_EQ(fit.barriers, 0u);
    EXPECT_EQ(edges.back().classification, EdgeClass::Corridor);
    EXPECT_NEAR(edges.back().scaledDistance, 0.25, 1e-6);
}

// Every edge at the same separation leaves nothing to fit
TEST(BarrierScorerTest, SingleDistinctDistanceIsNotFitted) {
    std::vector<EdgeMetrics> edges = {edge(120.0, 0.1), edge(120.0, 0.9), edge(120.0, 0.3)};
    BarrierScorer scorer(testParams());
    FitSummary fit = scorer.score(edges);

    EXPECT_FALSE(fit.fitted);
    EXPECT_TRUE(fit.curve.empty());
    EXPECT_EQ(fit.normal, 3u);
    for (const auto& e : edges) {
        EXPECT_EQ(e.classification, EdgeClass::Normal);
        EXPECT_DOUBLE_EQ(e.scaledDistance, 1.0);
    }
}

TEST(BarrierScorerTest, SingleEdgeIsNormal) {
    std::vector<EdgeMetrics> edges = {edge(300.0, 0.4)};
    FitSummary fit = BarrierScorer(testParams()).score(edges);
    EXPECT_FALSE(fit.fitted);
    EXPECT_EQ(edges[0].classification, EdgeClass::Normal);
    EXPECT_DOUBLE_EQ(edges[0].scaledDistance, 1.0);
}

TEST(BarrierScorerTest, NoEdges) {
    std::vector<EdgeMetrics> edges;
    FitSummary fit = BarrierScorer(testParams()).score(edges);
    EXPECT_FALSE(fit.fitted);
    EXPECT_EQ(fit.trainingSize, 0u);
}

// A zero expectation falls back to the neutral ratio instead of dividing
TEST(BarrierScorerTest, ZeroExpectationIsNeutral) {
    BarrierScorer scorer(testParams(), [](const ScoringParams&) {
        return std::unique_ptr<CurveSmoother>(new ZeroCurve());
    });
    auto edges = flatWithOddEdge(0.8);
    FitSummary fit = scorer.score(edges);

    ASSERT_TRUE(fit.fitted);
    EXPECT_EQ(fit.neutralFallbacks, edges.size());
    for (const auto& e : edges) {
        EXPECT_DOUBLE_EQ(e.scaledDistance, 1.0);
        EXPECT_EQ(e.classification, EdgeClass::Normal);
    }
}

// A factory that yields nothing is reported instead of dereferenced
TEST(BarrierScorerTest, NullSmootherIsRejected) {
    BarrierScorer scorer(testParams(), [](const ScoringParams&) {
        return std::unique_ptr<CurveSmoother>();
    });
    auto edges = flatWithOddEdge(0.8);
    EXPECT_THROW(scorer.score(edges), ConfigurationError);
}

// Same edges, same scores
TEST(BarrierScorerTest, Deterministic) {
    std::vector<EdgeMetrics> first, second;
    for (int i = 0; i < 30; ++i) {
        double geo = 50.0 + 17.0 * i;
        double genetic = 0.01 + geo * 1e-4 + ((i * 7) % 5) * 0.003;
        first.push_back(edge(geo, genetic));
    }
    second = first;

    BarrierScorer scorer(testParams());
    scorer.score(first);
    scorer.score(second);
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].scaledDistance, second[i].scaledDistance);
        EXPECT_EQ(first[i].classification, second[i].classification);
    }
}

// The reported curve is monotone by default
TEST(BarrierScorerTest, CurveIsMonotone) {
    std::vector<EdgeMetrics> edges;
    for (int i = 0; i < 25; ++i) {
        double geo = 40.0 + 30.0 * i;
        edges.push_back(edge(geo, 0.05 + 0.02 * std::sin(i * 1.3) + geo * 5e-5));
    }
    FitSummary fit = BarrierScorer(ScoringParams{}).score(edges);
    ASSERT_TRUE(fit.fitted);
    ASSERT_EQ(fit.curve.size(), edges.size());
    for (std::size_t k = 1; k < fit.curve.size(); ++k) {
        EXPECT_GE(fit.curve[k].second, fit.curve[k - 1].second);
    }
}

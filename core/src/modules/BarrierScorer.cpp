#include "modules/BarrierScorer.h"
#include "kernel/Errors.h"
#include <cmath>
#include <string>
#include <utility>

BarrierScorer::BarrierScorer(const ScoringParams& params, SmootherFactory factory)
    : params_(params), factory_(std::move(factory)) {
    if (!(params.bandwidth > 0.0 && params.bandwidth <= 1.0)) {
        throw ConfigurationError("lowess bandwidth must be in (0, 1] (got " +
                                 std::to_string(params.bandwidth) + ")");
    }
    if (!(params.barrierThreshold > 1.0) || !std::isfinite(params.barrierThreshold)) {
        throw ConfigurationError("barrier threshold must be > 1 (got " +
                                 std::to_string(params.barrierThreshold) + ")");
    }
    if (!(params.corridorThreshold > 0.0 && params.corridorThreshold < 1.0)) {
        throw ConfigurationError("corridor threshold must be in (0, 1) (got " +
                                 std::to_string(params.corridorThreshold) + ")");
    }
}

std::unique_ptr<CurveSmoother> BarrierScorer::makeSmoother() const {
    if (factory_) {
        auto smoother = factory_(params_);
        if (!smoother) {
            throw ConfigurationError("smoother factory returned no smoother");
        }
        return smoother;
    }
    return std::make_unique<LowessSmoother>(params_.bandwidth, params_.robustIterations, params_.monotone);
}

EdgeClass BarrierScorer::classify(double scaled) const {
    if (scaled >= params_.barrierThreshold) return EdgeClass::Barrier;
    if (scaled <= params_.corridorThreshold) return EdgeClass::Corridor;
    return EdgeClass::Normal;
}

FitSummary BarrierScorer::score(std::vector<EdgeMetrics>& edges) const {
    FitSummary summary;
    summary.trainingSize = edges.size();

    std::vector<double> xs, ys;
    xs.reserve(edges.size());
    ys.reserve(edges.size());
    for (const auto& e : edges) {
        xs.push_back(e.geoDistanceKm);
        ys.push_back(e.geneticDistance);
    }

    auto smoother = makeSmoother();
    summary.fitted = !edges.empty() && smoother->fit(xs, ys);

    if (summary.fitted) summary.curve = smoother->curve();

    for (auto& e : edges) {
        double scaled = 1.0;
        if (summary.fitted) {
            auto expected = smoother->evaluate(e.geoDistanceKm);
            if (expected && std::isfinite(*expected) && *expected > 0.0) {
                scaled = e.geneticDistance / *expected;
            } else {
                ++summary.neutralFallbacks;
            }
        }
        e.scaledDistance = scaled;
        e.classification = summary.fitted ? classify(scaled) : EdgeClass::Normal;

        switch (e.classification) {
            case EdgeClass::Barrier: ++summary.barriers; break;
            case EdgeClass::Corridor: ++summary.corridors; break;
            default: ++summary.normal; break;
        }
    }
    return summary;
}

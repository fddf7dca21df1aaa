#ifndef BARRIER_SCORER_H
#define BARRIER_SCORER_H

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "modules/DistanceAggregator.h"
#include "modules/Lowess.h"

struct ScoringParams {
    double bandwidth = 2.0 / 3.0;     // LOWESS fraction, (0, 1]
    double barrierThreshold = 1.5;    // scaled >= this -> barrier, > 1
    double corridorThreshold = 0.67;  // scaled <= this -> corridor, (0, 1)
    int robustIterations = 3;
    bool monotone = true;
};

struct FitSummary {
    bool fitted = false;              // false: fewer than 2 distinct geo distances
    std::size_t trainingSize = 0;
    std::size_t neutralFallbacks = 0; // edges scored 1.0 because f was 0 or undefined
    std::size_t normal = 0;
    std::size_t barriers = 0;
    std::size_t corridors = 0;
    std::vector<std::pair<double, double>> curve;   // (geo km, expected genetic distance)
};

/**
 * Flags hexagon pairs whose genetic distance is out of line with their
 * geographic separation.
 *
 * Per bin: fit f(geo) -> expected genetic distance over every edge, then
 *   scaled = genetic / f(geo)         (1.0 when f is 0 or undefined there)
 *   scaled >= barrierThreshold  -> Barrier
 *   scaled <= corridorThreshold -> Corridor
 *   otherwise                   -> Normal
 * With fewer than two distinct geo distances there is nothing to fit and
 * every edge is Normal with scaled 1.0.
 *
 * Deterministic: the smoother has no random component.
 */
class BarrierScorer {
public:
    using SmootherFactory = std::function<std::unique_ptr<CurveSmoother>(const ScoringParams&)>;

    // Without a factory the scorer fits a LowessSmoother
    explicit BarrierScorer(const ScoringParams& params, SmootherFactory factory = {});

    FitSummary score(std::vector<EdgeMetrics>& edges) const;

    // Pure classification rule
    EdgeClass classify(double scaled) const;

private:
    ScoringParams params_;
    SmootherFactory factory_;

    std::unique_ptr<CurveSmoother> makeSmoother() const;
};

#endif

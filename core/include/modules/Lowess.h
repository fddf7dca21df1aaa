#ifndef LOWESS_H
#define LOWESS_H

#include <optional>
#include <utility>
#include <vector>

/**
 * Smooth expected-value curve y = f(x) learned from scattered observations.
 *
 * evaluate() returns nothing where the curve is undefined (before fit(),
 * or outside the training range); callers decide the fallback.
 */
class CurveSmoother {
public:
    virtual ~CurveSmoother() = default;

    // Returns false when the data cannot support a curve
    virtual bool fit(const std::vector<double>& xs, const std::vector<double>& ys) = 0;
    virtual std::optional<double> evaluate(double x) const = 0;
    virtual bool fitted() const = 0;

    // Fitted curve as (x, f(x)) knots, ascending in x; empty before fit()
    virtual std::vector<std::pair<double, double>> curve() const = 0;
};

/**
 * LOWESS (Cleveland 1979)
 *
 * For each distinct x: take the ceil(frac * n) nearest observations, weight
 * them with the tricube kernel (1 - (d/h)^3)^3 and fit a weighted straight
 * line; the line's value at x is the smoothed value. Robustness passes
 * reweight observations with the bisquare of residual / (6 * median |residual|).
 * With `monotone` set, a pool-adjacent-violators pass makes the fitted values
 * non-decreasing in x.
 *
 * Between fitted x values the curve is linearly interpolated.
 */
class LowessSmoother : public CurveSmoother {
public:
    explicit LowessSmoother(double frac = 2.0 / 3.0, int robustIterations = 3, bool monotone = true);

    bool fit(const std::vector<double>& xs, const std::vector<double>& ys) override;
    std::optional<double> evaluate(double x) const override;
    bool fitted() const override { return !knots_.empty(); }

    // One knot per distinct training x
    std::vector<std::pair<double, double>> curve() const override { return knots_; }

private:
    double frac_;
    int robust_iterations_;
    bool monotone_;
    std::vector<std::pair<double, double>> knots_;

    static double localFit(const std::vector<double>& xs, const std::vector<double>& ys,
                           const std::vector<double>& robustness, std::size_t window, double x0);
    static double median(std::vector<double> values);
};

#endif

#include "modules/Lowess.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

LowessSmoother::LowessSmoother(double frac, int robustIterations, bool monotone)
    : frac_(frac), robust_iterations_(std::max(0, robustIterations)), monotone_(monotone) {
    if (!(frac > 0.0 && frac <= 1.0)) {
        throw std::invalid_argument("LOWESS bandwidth must be in (0, 1] (got " + std::to_string(frac) + ")");
    }
}

double LowessSmoother::median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) return upper;
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

double LowessSmoother::localFit(const std::vector<double>& xs, const std::vector<double>& ys,
                                const std::vector<double>& robustness, std::size_t window, double x0) {
    const std::size_t n = xs.size();

    std::vector<double> dist(n);
    for (std::size_t i = 0; i < n; ++i) dist[i] = std::abs(xs[i] - x0);
    std::vector<double> sorted = dist;
    std::nth_element(sorted.begin(), sorted.begin() + (window - 1), sorted.end());
    const double h = sorted[window - 1];

    std::vector<double> w(n, 0.0);
    double sum_w = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double k = 0.0;
        if (h <= 0.0) {
            k = (dist[i] == 0.0) ? 1.0 : 0.0;
        } else if (dist[i] < h) {
            const double u = dist[i] / h;
            const double t = 1.0 - u * u * u;
            k = t * t * t;
        }
        w[i] = k * robustness[i];
        sum_w += w[i];
    }

    if (sum_w <= 0.0) {
        // Every neighbor was down-weighted to zero: plain mean of the window
        double s = 0.0;
        std::size_t c = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (dist[i] <= h) {
                s += ys[i];
                ++c;
            }
        }
        return c > 0 ? s / c : 0.0;
    }

    double x_bar = 0.0, y_bar = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        x_bar += w[i] * xs[i];
        y_bar += w[i] * ys[i];
    }
    x_bar /= sum_w;
    y_bar /= sum_w;

    double sxx = 0.0, sxy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = xs[i] - x_bar;
        sxx += w[i] * dx * dx;
        sxy += w[i] * dx * (ys[i] - y_bar);
    }

    // No spread in x under the kernel: the local line is flat
    const double scale = std::max(h, std::abs(x0)) + 1.0;
    if (sxx <= 1e-12 * scale * scale * sum_w) return y_bar;
    return y_bar + (sxy / sxx) * (x0 - x_bar);
}

bool LowessSmoother::fit(const std::vector<double>& xs_in, const std::vector<double>& ys_in) {
    if (xs_in.size() != ys_in.size()) {
        throw std::invalid_argument("LOWESS needs as many x as y values (" + std::to_string(xs_in.size()) +
                                    " vs " + std::to_string(ys_in.size()) + ")");
    }
    knots_.clear();

    std::vector<std::pair<double, double>> obs;
    obs.reserve(xs_in.size());
    for (std::size_t i = 0; i < xs_in.size(); ++i) {
        if (std::isfinite(xs_in[i]) && std::isfinite(ys_in[i])) obs.emplace_back(xs_in[i], ys_in[i]);
    }
    std::sort(obs.begin(), obs.end());

    std::vector<double> xs, ys;
    xs.reserve(obs.size());
    ys.reserve(obs.size());
    for (const auto& [x, y] : obs) {
        xs.push_back(x);
        ys.push_back(y);
    }

    // Distinct x values and, per observation, the index of its x
    std::vector<double> grid;
    std::vector<double> grid_weight;
    std::vector<std::size_t> slot(xs.size());
    for (std::size_t i = 0; i < xs.size(); ++i) {
        if (grid.empty() || xs[i] != grid.back()) {
            grid.push_back(xs[i]);
            grid_weight.push_back(0.0);
        }
        slot[i] = grid.size() - 1;
        grid_weight.back() += 1.0;
    }
    if (grid.size() < 2) return false;

    const std::size_t n = xs.size();
    const std::size_t window = std::clamp<std::size_t>(
        static_cast<std::size_t>(std::ceil(frac_ * static_cast<double>(n))), 2, n);

    std::vector<double> robustness(n, 1.0);
    std::vector<double> fitted(grid.size(), 0.0);

    for (int iter = 0; iter <= robust_iterations_; ++iter) {
        for (std::size_t g = 0; g < grid.size(); ++g) {
            fitted[g] = localFit(xs, ys, robustness, window, grid[g]);
        }
        if (iter == robust_iterations_) break;

        std::vector<double> abs_res(n);
        for (std::size_t i = 0; i < n; ++i) abs_res[i] = std::abs(ys[i] - fitted[slot[i]]);
        const double s = median(abs_res);

        double y_scale = 0.0;
        for (double y : ys) y_scale += std::abs(y);
        y_scale = y_scale / n + 1e-300;
        if (s <= 1e-12 * y_scale) break;   // already exact

        for (std::size_t i = 0; i < n; ++i) {
            const double u = abs_res[i] / (6.0 * s);
            robustness[i] = (u < 1.0) ? (1.0 - u * u) * (1.0 - u * u) : 0.0;
        }
    }

    if (monotone_) {
        // Pool adjacent violators, weighted by observations per x
        struct Block { double value; double weight; std::size_t count; };
        std::vector<Block> blocks;
        blocks.reserve(grid.size());
        for (std::size_t g = 0; g < grid.size(); ++g) {
            blocks.push_back({fitted[g], grid_weight[g], 1});
            while (blocks.size() > 1 && blocks[blocks.size() - 2].value > blocks.back().value) {
                Block top = blocks.back();
                blocks.pop_back();
                Block& prev = blocks.back();
                const double w = prev.weight + top.weight;
                prev.value = (prev.value * prev.weight + top.value * top.weight) / w;
                prev.weight = w;
                prev.count += top.count;
            }
        }
        std::size_t g = 0;
        for (const auto& b : blocks) {
            for (std::size_t k = 0; k < b.count; ++k) fitted[g++] = b.value;
        }
    }

    knots_.reserve(grid.size());
    for (std::size_t g = 0; g < grid.size(); ++g) knots_.emplace_back(grid[g], fitted[g]);
    return true;
}

std::optional<double> LowessSmoother::evaluate(double x) const {
    if (knots_.empty() || !std::isfinite(x)) return std::nullopt;
    if (x < knots_.front().first || x > knots_.back().first) return std::nullopt;

    auto it = std::lower_bound(knots_.begin(), knots_.end(), x,
        [](const std::pair<double, double>& k, double v) { return k.first < v; });
    if (it->first == x) return it->second;

    auto prev = it - 1;
    const double t = (x - prev->first) / (it->first - prev->first);
    return prev->second + t * (it->second - prev->second);
}

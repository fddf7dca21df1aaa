#include "kernel/SampleStore.h"
#include "kernel/Errors.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace {
    // Relative tolerance for the symmetry check (matrices arrive as text)
    constexpr double kSymmetryTolerance = 1e-9;
}

DistanceMatrix DistanceMatrix::fromRows(const std::vector<std::vector<double>>& rows) {
    DistanceMatrix m;
    m.n_ = rows.size();
    m.data_.assign(m.n_ * m.n_, 0.0);
    for (std::size_t i = 0; i < m.n_; ++i) {
        if (rows[i].size() != m.n_) {
            throw InputInconsistencyError(
                "distance matrix is not square: row " + std::to_string(i) + " has " +
                std::to_string(rows[i].size()) + " columns, expected " + std::to_string(m.n_),
                {i});
        }
        std::copy(rows[i].begin(), rows[i].end(), m.data_.begin() + i * m.n_);
    }
    return m;
}

DistanceMatrix DistanceMatrix::uniform(std::size_t n, double value) {
    DistanceMatrix m;
    m.n_ = n;
    m.data_.assign(n * n, value);
    for (std::size_t i = 0; i < n; ++i) {
        m.data_[i * n + i] = 0.0;
    }
    return m;
}

SampleStore::SampleStore(std::vector<Sample> samples, DistanceMatrix distances)
    : samples_(std::move(samples)), distances_(std::move(distances)) {
    validate();

    if (!samples_.empty()) {
        auto [lo, hi] = std::minmax_element(samples_.begin(), samples_.end(),
            [](const Sample& a, const Sample& b) { return a.age < b.age; });
        min_age_ = lo->age;
        max_age_ = hi->age;
    }
}

void SampleStore::validate() const {
    const std::size_t n = samples_.size();
    if (distances_.size() != n) {
        throw InputInconsistencyError(
            "distance matrix is " + std::to_string(distances_.size()) + "x" +
            std::to_string(distances_.size()) + " but there are " + std::to_string(n) + " samples",
            {distances_.size(), n});
    }

    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < n; ++i) {
        const Sample& s = samples_[i];
        if (!std::isfinite(s.lat) || s.lat < -90.0 || s.lat > 90.0 ||
            !std::isfinite(s.lon) || s.lon < -180.0 || s.lon > 180.0) {
            throw InputInconsistencyError(
                "sample " + std::to_string(i) + " ('" + s.id + "') has coordinates outside the globe", {i});
        }
        if (s.age < 0) {
            throw InputInconsistencyError(
                "sample " + std::to_string(i) + " ('" + s.id + "') has a negative age", {i});
        }
        if (!seen.insert(s.id).second) {
            throw InputInconsistencyError("duplicate sample id '" + s.id + "'", {i});
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (distances_.at(i, i) != 0.0) {
            throw InputInconsistencyError(
                "distance matrix diagonal is non-zero at " + std::to_string(i), {i, i});
        }
        for (std::size_t j = i + 1; j < n; ++j) {
            double dij = distances_.at(i, j);
            double dji = distances_.at(j, i);
            if (!std::isfinite(dij) || !std::isfinite(dji) || dij < 0.0 || dji < 0.0) {
                throw InputInconsistencyError(
                    "distance matrix entry (" + std::to_string(i) + "," + std::to_string(j) +
                    ") is negative or not finite", {i, j});
            }
            double scale = std::max(1.0, std::max(dij, dji));
            if (std::abs(dij - dji) > kSymmetryTolerance * scale) {
                throw InputInconsistencyError(
                    "distance matrix is not symmetric at (" + std::to_string(i) + "," +
                    std::to_string(j) + ")", {i, j});
            }
        }
    }
}

std::int64_t SampleStore::indexOf(const std::string& id) const {
    for (std::size_t i = 0; i < samples_.size(); ++i) {
        if (samples_[i].id == id) return static_cast<std::int64_t>(i);
    }
    return -1;
}

#ifndef SAMPLE_STORE_H
#define SAMPLE_STORE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------- Sample ----------
struct Sample {
    std::string id;
    double lat = 0.0;           // [-90, 90]
    double lon = 0.0;           // [-180, 180]
    std::int64_t age = 0;       // years before 1950 CE
};

/**
 * Symmetric pairwise genetic distance matrix, row-major, keyed by sample row.
 *
 * The triangle inequality is not assumed anywhere: admixture distances
 * are taken as given.
 */
class DistanceMatrix {
public:
    DistanceMatrix() = default;

    // Builds from nested rows. Rows must form a square; content is checked
    // by SampleStore so the offending indices can be reported together.
    static DistanceMatrix fromRows(const std::vector<std::vector<double>>& rows);

    // n x n matrix with every off-diagonal entry equal to `value`
    static DistanceMatrix uniform(std::size_t n, double value);

    std::size_t size() const { return n_; }
    double at(std::size_t i, std::size_t j) const { return data_[i * n_ + j]; }

private:
    std::size_t n_ = 0;
    std::vector<double> data_;
};

/**
 * Immutable sample table plus its distance matrix.
 *
 * Loaded once and shared read-only by every recomputation.
 * The constructor throws InputInconsistencyError when the two inputs disagree.
 */
class SampleStore {
public:
    SampleStore(std::vector<Sample> samples, DistanceMatrix distances);

    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    const Sample& sample(std::size_t i) const { return samples_[i]; }
    double distance(std::size_t i, std::size_t j) const { return distances_.at(i, j); }

    // Row index of a sample id, or -1
    std::int64_t indexOf(const std::string& id) const;

    std::int64_t minAge() const { return min_age_; }
    std::int64_t maxAge() const { return max_age_; }

private:
    std::vector<Sample> samples_;
    DistanceMatrix distances_;
    std::int64_t min_age_ = 0;
    std::int64_t max_age_ = 0;

    void validate() const;
};

#endif

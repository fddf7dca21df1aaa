#ifndef TIME_BINNER_H
#define TIME_BINNER_H

#include <cstdint>
#include <string>
#include <vector>

class SampleStore;

enum class BinningMode {
    EqualWidth,   // K intervals of equal age span (default)
    EqualCount    // K chunks with the same number of samples
};

struct TimeBin {
    std::uint32_t index = 0;
    double ageMin = 0.0;
    double ageMax = 0.0;
    std::vector<std::uint32_t> members;   // sample rows, ascending
};

/**
 * Partitions samples into K ordered age bins.
 *
 * Bins are left-inclusive and right-exclusive, the last bin is closed on
 * both ends. Equal-width bins may be empty or sparse; they are never
 * rebalanced. Equal-count bins never split a run of identical ages, so
 * trailing bins can be empty when ages repeat a lot.
 */
class TimeBinner {
public:
    explicit TimeBinner(std::uint32_t binCount, BinningMode mode = BinningMode::EqualWidth);

    std::vector<TimeBin> partition(const SampleStore& store) const;

    // Equal-width bin for a single age given the observed range
    std::uint32_t binFor(std::int64_t age, std::int64_t minAge, std::int64_t maxAge) const;

private:
    std::uint32_t bin_count_;
    BinningMode mode_;

    std::vector<TimeBin> partitionEqualWidth(const SampleStore& store) const;
    std::vector<TimeBin> partitionEqualCount(const SampleStore& store) const;
};

// "7050 BC - 5050 BC" style label for a bin (ages are years before 1950)
std::string formatAgeLabel(double ageMin, double ageMax);

const char* binningModeName(BinningMode mode);

#endif

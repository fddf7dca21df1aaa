#include "modules/TimeBinner.h"
#include "kernel/Errors.h"
#include "kernel/SampleStore.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace {
    constexpr std::int64_t kPresentYearCE = 1950;   // reference epoch for ages
}

TimeBinner::TimeBinner(std::uint32_t binCount, BinningMode mode)
    : bin_count_(binCount), mode_(mode) {
    if (binCount == 0) {
        throw ConfigurationError("bin count must be >= 1 (got 0)");
    }
}

std::uint32_t TimeBinner::binFor(std::int64_t age, std::int64_t minAge, std::int64_t maxAge) const {
    if (maxAge <= minAge || age <= minAge) return 0;
    if (age >= maxAge) return bin_count_ - 1;
    // Exact integer arithmetic keeps boundary ages left-inclusive
    std::int64_t idx = ((age - minAge) * static_cast<std::int64_t>(bin_count_)) / (maxAge - minAge);
    return static_cast<std::uint32_t>(std::min<std::int64_t>(idx, bin_count_ - 1));
}

std::vector<TimeBin> TimeBinner::partition(const SampleStore& store) const {
    if (mode_ == BinningMode::EqualCount) {
        return partitionEqualCount(store);
    }
    return partitionEqualWidth(store);
}

std::vector<TimeBin> TimeBinner::partitionEqualWidth(const SampleStore& store) const {
    std::vector<TimeBin> bins(bin_count_);
    const std::int64_t lo = store.minAge();
    const std::int64_t hi = store.maxAge();
    const double width = static_cast<double>(hi - lo) / bin_count_;

    for (std::uint32_t b = 0; b < bin_count_; ++b) {
        bins[b].index = b;
        bins[b].ageMin = lo + width * b;
        bins[b].ageMax = (b + 1 == bin_count_) ? static_cast<double>(hi) : lo + width * (b + 1);
    }

    for (std::size_t i = 0; i < store.size(); ++i) {
        std::uint32_t b = binFor(store.sample(i).age, lo, hi);
        bins[b].members.push_back(static_cast<std::uint32_t>(i));
    }
    return bins;
}

std::vector<TimeBin> TimeBinner::partitionEqualCount(const SampleStore& store) const {
    std::vector<TimeBin> bins(bin_count_);
    for (std::uint32_t b = 0; b < bin_count_; ++b) bins[b].index = b;

    const std::size_t n = store.size();
    std::vector<std::uint32_t> order(n);
    std::iota(order.begin(), order.end(), 0u);
    std::stable_sort(order.begin(), order.end(), [&store](std::uint32_t a, std::uint32_t b) {
        return store.sample(a).age < store.sample(b).age;
    });

    const std::size_t per_bin = n / bin_count_;
    std::size_t remainder = n % bin_count_;
    std::size_t start = 0;

    for (std::uint32_t b = 0; b < bin_count_ && start < n; ++b) {
        std::size_t end = std::min(n, start + per_bin + (remainder > 0 ? 1 : 0));
        if (remainder > 0) --remainder;
        if (b + 1 == bin_count_) end = n;
        if (end == start) end = start + 1;

        // Keep a run of equal ages together in this bin
        while (end < n && store.sample(order[end]).age == store.sample(order[end - 1]).age) {
            ++end;
        }

        for (std::size_t k = start; k < end; ++k) {
            bins[b].members.push_back(order[k]);
        }
        std::sort(bins[b].members.begin(), bins[b].members.end());
        start = end;
    }

    // A non-empty bin spans from its youngest member to the next bin's youngest
    // member; bins left empty after the samples ran out sit on the closing edge.
    const double closing = static_cast<double>(store.maxAge());
    for (std::uint32_t b = 0; b < bin_count_; ++b) {
        bins[b].ageMin = bins[b].members.empty()
            ? closing
            : static_cast<double>(store.sample(bins[b].members.front()).age);
        for (auto m : bins[b].members) {
            bins[b].ageMin = std::min(bins[b].ageMin, static_cast<double>(store.sample(m).age));
        }
    }
    for (std::uint32_t b = 0; b < bin_count_; ++b) {
        bins[b].ageMax = (b + 1 < bin_count_ && !bins[b + 1].members.empty())
            ? bins[b + 1].ageMin
            : closing;
    }
    return bins;
}

std::string formatAgeLabel(double ageMin, double ageMax) {
    auto render = [](double age) {
        std::int64_t years = static_cast<std::int64_t>(std::llround(age));
        std::ostringstream os;
        if (years < kPresentYearCE) {
            os << (kPresentYearCE - years) << " AD";
        } else {
            os << (years - kPresentYearCE) << " BC";
        }
        return os.str();
    };
    return render(ageMin) + " - " + render(ageMax);
}

const char* binningModeName(BinningMode mode) {
    switch (mode) {
        case BinningMode::EqualWidth: return "width";
        case BinningMode::EqualCount: return "count";
    }
    return "width";
}

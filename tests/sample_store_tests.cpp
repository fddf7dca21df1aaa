#include <gtest/gtest.h>
#include "kernel/Errors.h"
#include "kernel/SampleStore.h"

namespace {

std::vector<Sample> threeSamples() {
    return {
        {"I0001", 45.0, 10.0, 7000},
        {"I0002", 46.0, 11.0, 5000},
        {"I0003", 47.0, 12.0, 3000},
    };
}

}

// A consistent table and matrix load and report their age range
TEST(SampleStoreTest, BuildsFromConsistentInput) {
    DistanceMatrix m = DistanceMatrix::fromRows({
        {0.0, 0.1, 0.4},
        {0.1, 0.0, 0.1},
        {0.4, 0.1, 0.0},
    });

    SampleStore store(threeSamples(), m);

    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(store.empty());
    EXPECT_EQ(store.minAge(), 3000);
    EXPECT_EQ(store.maxAge(), 7000);
    EXPECT_DOUBLE_EQ(store.distance(0, 2), 0.4);
    EXPECT_DOUBLE_EQ(store.distance(2, 0), 0.4);
    EXPECT_DOUBLE_EQ(store.distance(1, 1), 0.0);
    EXPECT_EQ(store.indexOf("I0002"), 1);
    EXPECT_EQ(store.indexOf("missing"), -1);
}

TEST(SampleStoreTest, EmptyStoreIsValid) {
    SampleStore store({}, DistanceMatrix::uniform(0, 0.0));
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.minAge(), 0);
    EXPECT_EQ(store.maxAge(), 0);
}

// Matrix dimension must match the sample count
TEST(SampleStoreTest, RejectsDimensionMismatch) {
    EXPECT_THROW(SampleStore(threeSamples(), DistanceMatrix::uniform(4, 0.1)), InputInconsistencyError);
}

TEST(SampleStoreTest, RejectsNonSquareRows) {
    std::vector<std::vector<double>> rows = {{0.0, 0.1}, {0.1}};
    EXPECT_THROW(DistanceMatrix::fromRows(rows), InputInconsistencyError);
}

// The offending pair is carried on the error
TEST(SampleStoreTest, RejectsAsymmetricMatrix) {
    auto m = DistanceMatrix::fromRows({
        {0.0, 0.1, 0.2},
        {0.3, 0.0, 0.2},
        {0.2, 0.2, 0.0},
    });
    try {
        SampleStore store(threeSamples(), m);
        FAIL() << "asymmetric matrix accepted";
    } catch (const InputInconsistencyError& e) {
        ASSERT_EQ(e.indices().size(), 2u);
        EXPECT_EQ(e.indices()[0], 0u);
        EXPECT_EQ(e.indices()[1], 1u);
    }
}

TEST(SampleStoreTest, ToleratesTextRoundingInSymmetry) {
    auto m = DistanceMatrix::fromRows({
        {0.0, 0.1234567890123, 0.2},
        {0.1234567890124, 0.0, 0.2},
        {0.2, 0.2, 0.0},
    });
    EXPECT_NO_THROW(SampleStore(threeSamples(), m));
}

TEST(SampleStoreTest, RejectsNonZeroDiagonal) {
    auto rows = std::vector<std::vector<double>>{
        {0.0, 0.1, 0.1},
        {0.1, 0.5, 0.1},
        {0.1, 0.1, 0.0},
    };
    EXPECT_THROW(SampleStore(threeSamples(), DistanceMatrix::fromRows(rows)), InputInconsistencyError);
}

TEST(SampleStoreTest, RejectsNegativeDistance) {
    auto m = DistanceMatrix::fromRows({
        {0.0, 0.1, 0.1},
        {0.1, 0.0, -0.01},
        {0.1, -0.01, 0.0},
    });
    EXPECT_THROW(SampleStore(threeSamples(), m), InputInconsistencyError);
}

TEST(SampleStoreTest, RejectsDuplicateIds) {
    auto samples = threeSamples();
    samples[2].id = "I0001";
    EXPECT_THROW(SampleStore(samples, DistanceMatrix::uniform(3, 0.1)), InputInconsistencyError);
}

TEST(SampleStoreTest, RejectsCoordinatesOffTheGlobe) {
    auto samples = threeSamples();
    samples[1].lat = 91.0;
    EXPECT_THROW(SampleStore(samples, DistanceMatrix::uniform(3, 0.1)), InputInconsistencyError);

    samples = threeSamples();
    samples[0].lon = -180.5;
    EXPECT_THROW(SampleStore(samples, DistanceMatrix::uniform(3, 0.1)), InputInconsistencyError);
}

TEST(SampleStoreTest, RejectsNegativeAge) {
    auto samples = threeSamples();
    samples[0].age = -1;
    EXPECT_THROW(SampleStore(samples, DistanceMatrix::uniform(3, 0.1)), InputInconsistencyError);
}

#include <gtest/gtest.h>
#include "io/SampleLoader.h"
#include "io/Snapshot.h"
#include "kernel/Errors.h"
#include <sstream>

namespace {

const char* kSampleList =
    "ID\tMaster ID\tLatitude\tLongitude\tAge\n"
    "I0001\tM1\t48.1\t11.6\t7250\n"
    "I0002\tM2\t..\t..\t6100\n"
    "I0003\tM3\t52.5\t13.4\t..\n"
    "I0004\tM4\t41.9\t12.5\t5049.6\n"
    "I0005\tM5\t45.4\t4.8\t3000\n";

const char* kMatrix =
    "\tI0005\tI0001\tX9\tI0004\n"
    "I0005\t0\t0.2\t0.9\t0.3\n"
    "I0001\t0.2\t0\t0.8\t0.1\n"
    "X9\t0.9\t0.8\t0\t0.7\n"
    "I0004\t0.3\t0.1\t0.7\t0\n";

std::shared_ptr<const PipelineResult> runSmallPipeline() {
    std::istringstream samples_in(kSampleList);
    auto samples = readSamples(samples_in);
    std::istringstream matrix_in(kMatrix);
    auto matrix = readDistanceMatrix(matrix_in, samples);

    Pipeline pipeline(std::make_shared<const SampleStore>(samples, matrix));
    PipelineConfig cfg;
    cfg.binCount = 1;
    return pipeline.submit(cfg);
}

}

// Rows without coordinates or age are skipped and counted
TEST(SampleLoaderTest, ReadsSampleList) {
    std::istringstream in(kSampleList);
    LoadReport report;
    auto samples = readSamples(in, &report);

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(report.rowsRead, 5u);
    EXPECT_EQ(report.rowsKept, 3u);
    EXPECT_EQ(report.skippedCoordinates, 1u);
    EXPECT_EQ(report.skippedAge, 1u);

    EXPECT_EQ(samples[0].id, "I0001");
    EXPECT_DOUBLE_EQ(samples[0].lat, 48.1);
    EXPECT_DOUBLE_EQ(samples[0].lon, 11.6);
    EXPECT_EQ(samples[0].age, 7250);
    EXPECT_EQ(samples[1].id, "I0004");
    EXPECT_EQ(samples[1].age, 5050);
}

TEST(SampleLoaderTest, RejectsHeaderWithoutRequiredColumns) {
    std::istringstream in("ID\tLat\tLon\tAge\nI1\t1\t2\t3\n");
    EXPECT_THROW(readSamples(in), std::runtime_error);

    std::istringstream empty("");
    EXPECT_THROW(readSamples(empty), std::runtime_error);
}

// Matrix rows and columns follow sample order; unlisted samples are dropped
TEST(SampleLoaderTest, ReordersMatrixToSamples) {
    std::istringstream samples_in(kSampleList);
    auto samples = readSamples(samples_in);
    std::istringstream matrix_in(kMatrix);
    DistanceMatrix m = readDistanceMatrix(matrix_in, samples);

    // samples: I0001, I0004, I0005
    ASSERT_EQ(m.size(), 3u);
    EXPECT_DOUBLE_EQ(m.at(0, 1), 0.1);
    EXPECT_DOUBLE_EQ(m.at(0, 2), 0.2);
    EXPECT_DOUBLE_EQ(m.at(1, 2), 0.3);
    EXPECT_DOUBLE_EQ(m.at(2, 0), 0.2);
    EXPECT_DOUBLE_EQ(m.at(1, 1), 0.0);
}

TEST(SampleLoaderTest, MissingSampleInMatrixIsRejected) {
    std::vector<Sample> samples = {{"I0001", 1.0, 1.0, 10}, {"NOPE", 2.0, 2.0, 20}};
    std::istringstream matrix_in(kMatrix);
    try {
        readDistanceMatrix(matrix_in, samples);
        FAIL() << "sample without a column accepted";
    } catch (const InputInconsistencyError& e) {
        EXPECT_EQ(e.indices(), (std::vector<std::size_t>{1}));
    }
}

TEST(SampleLoaderTest, NonNumericDistanceIsRejected) {
    std::vector<Sample> samples = {{"A", 1.0, 1.0, 10}, {"B", 2.0, 2.0, 20}};
    std::istringstream matrix_in("\tA\tB\nA\t0\tabc\nB\t0.1\t0\n");
    EXPECT_THROW(readDistanceMatrix(matrix_in, samples), InputInconsistencyError);
}

TEST(SampleLoaderTest, UnreadableFileIsReported) {
    EXPECT_THROW(loadSampleStore("/nonexistent/samples.tsv", "/nonexistent/matrix.tsv"), std::runtime_error);
}

TEST(SnapshotTest, CellIdsPrintAsFixedWidthHex) {
    std::string text = cellIdToString(HexGrid(3).cellFor(48.0, 11.0));
    EXPECT_EQ(text.size(), 16u);
    // Cell mode in the top bits, then the level
    EXPECT_EQ(text.substr(0, 3), "083");
    EXPECT_EQ(cellIdToString(0), "0000000000000000");
}

TEST(SnapshotTest, ResultJsonCarriesEveryBin) {
    auto result = runSmallPipeline();
    ASSERT_TRUE(result);

    std::string json = resultToJson(*result);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"config\":{"), std::string::npos);
    EXPECT_NE(json.find("\"bins\":["), std::string::npos);
    EXPECT_NE(json.find("\"topology\":\"triangulated\""), std::string::npos);
    EXPECT_NE(json.find("\"class\":\""), std::string::npos);
    EXPECT_NE(json.find("\"fit\":{"), std::string::npos);
    EXPECT_NE(json.find("\"unconnected\":["), std::string::npos);
    EXPECT_NE(json.find("\"isolated\":["), std::string::npos);
    EXPECT_NE(json.find("\"isolatedThreshold\":"), std::string::npos);
    EXPECT_EQ(json.find("\"boundary\""), std::string::npos);

    std::string withBoundaries = resultToJson(*result, true);
    EXPECT_NE(withBoundaries.find("\"boundary\":[["), std::string::npos);
}

TEST(SnapshotTest, BinJson) {
    auto result = runSmallPipeline();
    ASSERT_TRUE(result);
    EXPECT_EQ(binToJson(*result, 5), "{}");

    std::string json = binToJson(*result, 0);
    EXPECT_NE(json.find("\"index\":0"), std::string::npos);
    EXPECT_NE(json.find("\"label\":\""), std::string::npos);
}

// One CSV line per edge after the header
TEST(SnapshotTest, EdgeLog) {
    auto result = runSmallPipeline();
    ASSERT_TRUE(result);

    std::ostringstream out;
    logEdges(*result, out);
    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, "bin,cell_a,cell_b,geo_km,genetic,scaled,class");

    std::size_t rows = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("0,", 0), 0u);
        ++rows;
    }
    EXPECT_EQ(rows, result->bins[0].edges.size());

    std::ostringstream bare;
    logEdges(*result, bare, false);
    EXPECT_EQ(bare.str().find("bin,"), std::string::npos);
}

TEST(SnapshotTest, StatisticsReport) {
    auto result = runSmallPipeline();
    ASSERT_TRUE(result);
    std::ostringstream out;
    printStatistics(computeStatistics(*result), out);
    EXPECT_NE(out.str().find("Samples:        3"), std::string::npos);
    EXPECT_NE(out.str().find("Edges:"), std::string::npos);
}

// Formatting used by the report stays local to it
TEST(SnapshotTest, StatisticsLeaveStreamStateAlone) {
    auto result = runSmallPipeline();
    ASSERT_TRUE(result);
    std::ostringstream out;
    const auto flags = out.flags();
    const auto precision = out.precision();
    printStatistics(computeStatistics(*result), out);

    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), precision);
    out.str("");
    out << 0.5;
    EXPECT_EQ(out.str(), "0.5");
}

// Reelcut - CSV Job Loader Tests

#include <gtest/gtest.h>

#include <filesystem>

#include "core/loaders/csv_job_loader.h"
#include "core/optimizer/job_orchestrator.h"
#include "core/utils/file_utils.h"

using namespace rc;

namespace {

const char* kReels = "Serial,Item Number,Length\n"
                     "R1,W-10,100\n"
                     "R2,W-10,50\n"
                     "R3,W-20,200\n"
                     "R4,W-99,10\n";

const char* kCuts = "item_number,length,label\n"
                    "W-10,30,\n"
                    "W-10,30,\n"
                    "W-10,40,a\n"
                    "W-20,150,x\n"
                    "W-30,5,\n";

} // namespace

TEST(CsvJobLoader, GroupsByItemNumber) {
    CsvJobLoader loader;
    loader.setDefaultKerf(0.5);
    auto result = loader.loadFromStrings(kReels, kCuts);

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.jobs.size(), 3u);
    EXPECT_EQ(result.jobs[0].id, "W-10");
    EXPECT_EQ(result.jobs[1].id, "W-20");
    EXPECT_EQ(result.jobs[2].id, "W-30");

    const auto& w10 = result.jobs[0];
    EXPECT_EQ(w10.material.id, "W-10");
    EXPECT_DOUBLE_EQ(w10.material.kerf, 0.5);
    ASSERT_EQ(w10.cuts.size(), 2u);
    EXPECT_DOUBLE_EQ(w10.cuts[0].length, 30.0);
    EXPECT_EQ(w10.cuts[0].quantity, 2);
    EXPECT_EQ(w10.cuts[1].label, "a");
    ASSERT_EQ(w10.stock.size(), 2u);
    EXPECT_EQ(w10.stock[0].id, "R1");
    EXPECT_EQ(w10.stock[0].quantity, 1);
    EXPECT_DOUBLE_EQ(w10.stock[1].length, 50.0);

    // Item with cuts but no reels, reels for an item nobody cut
    EXPECT_TRUE(result.jobs[2].stock.empty());
    EXPECT_EQ(loader.reels().size(), 4u);
    EXPECT_EQ(loader.cuts().size(), 5u);
}

TEST(CsvJobLoader, LabelColumnIsOptional) {
    CsvJobLoader loader;
    auto result = loader.loadFromStrings("serial,item_number,length\nR1,A,10\n",
                                         "length,item_number\n4,A\n4,A\n3,A\n");
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.jobs.size(), 1u);
    ASSERT_EQ(result.jobs[0].cuts.size(), 2u);
    EXPECT_EQ(result.jobs[0].cuts[0].quantity, 2);
    EXPECT_TRUE(result.jobs[0].cuts[0].label.empty());
}

TEST(CsvJobLoader, MissingColumnsReported) {
    CsvJobLoader loader;
    auto result = loader.loadFromStrings("serial,length\nR1,10\n", "item_number\nA\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("reels: missing required column 'item_number'"), std::string::npos);
    EXPECT_NE(result.error.find("cuts: missing required column 'length'"), std::string::npos);
    EXPECT_TRUE(result.jobs.empty());
}

TEST(CsvJobLoader, BadRowsReportLineNumbers) {
    CsvJobLoader loader;
    auto result = loader.loadFromStrings("serial,item_number,length\nR1,A,10\nR2,A,abc\n",
                                         "item_number,length\nA,-4\n,3\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("reels line 3"), std::string::npos);
    EXPECT_NE(result.error.find("cuts line 2"), std::string::npos);
    EXPECT_NE(result.error.find("cuts line 3: empty item_number"), std::string::npos);
}

TEST(CsvJobLoader, ManyErrorsAreCapped) {
    std::string cuts = "item_number,length\n";
    for (int i = 0; i < 30; ++i) {
        cuts += "A,x\n";
    }
    CsvJobLoader loader;
    auto result = loader.loadFromStrings("serial,item_number,length\n", cuts);

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("... 10 more"), std::string::npos);
}

TEST(CsvJobLoader, EndToEndWithOrchestrator) {
    CsvJobLoader loader;
    auto loaded = loader.loadFromStrings(kReels, kCuts);
    ASSERT_TRUE(loaded);

    optimizer::JobOrchestrator orchestrator;
    auto report = orchestrator.runBatch(loaded.jobs);

    ASSERT_EQ(report.results.size(), 3u);

    // 40 + 30 + 30 fills R1 exactly, R2 stays untouched
    const auto& w10 = report.results[0];
    EXPECT_TRUE(w10.isComplete());
    ASSERT_EQ(w10.plan.assignments.size(), 1u);
    EXPECT_EQ(w10.stock[w10.plan.assignments[0].stockIndex].id, "R1");

    EXPECT_TRUE(report.results[1].isComplete());

    // No reels for W-30: the piece is unassigned
    const auto& w30 = report.results[2];
    EXPECT_EQ(w30.status, optimizer::JobStatus::Ok);
    ASSERT_EQ(w30.plan.shortages.size(), 1u);
    EXPECT_EQ(w30.plan.shortages[0].reason, optimizer::ShortageReason::Infeasible);
}

TEST(CsvJobLoader, LoadFromFiles) {
    auto dir = std::filesystem::temp_directory_path() / "rc_test_csv_loader";
    std::filesystem::create_directories(dir);
    ASSERT_TRUE(file::writeText(dir / "reels.csv", kReels));
    ASSERT_TRUE(file::writeText(dir / "cuts.csv", kCuts));

    CsvJobLoader loader;
    auto result = loader.load(dir / "reels.csv", dir / "cuts.csv");
    EXPECT_TRUE(result) << result.error;
    EXPECT_EQ(result.jobs.size(), 3u);

    auto missing = loader.load(dir / "nope.csv", dir / "cuts.csv");
    EXPECT_FALSE(missing);
    EXPECT_NE(missing.error.find("reels file"), std::string::npos);

    std::filesystem::remove_all(dir);
}

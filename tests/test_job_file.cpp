// Reelcut - Job File Tests

#include <gtest/gtest.h>

#include <filesystem>

#include "core/loaders/job_file.h"

using namespace rc;
using namespace rc::optimizer;

namespace {

const char* kSample = R"({
  "format_version": 1,
  "jobs": [
    {
      "id": "frame",
      "material": { "id": "steel-rod", "kerf": 2 },
      "stock": [
        { "id": "bar-6m", "length": 6000, "quantity": 10 },
        { "id": "bar-3m", "length": 3000, "cost": 2500 }
      ],
      "cuts": [
        { "length": 1200, "quantity": 4, "label": "rail" },
        { "length": 450.5 }
      ]
    },
    { "stock": [], "cuts": [] }
  ]
})";

} // namespace

TEST(JobFile, ParseSample) {
    JobFile file;
    auto result = file.parse(kSample);

    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.jobs.size(), 2u);

    const Job& job = result.jobs[0];
    EXPECT_EQ(job.id, "frame");
    EXPECT_EQ(job.material.id, "steel-rod");
    EXPECT_DOUBLE_EQ(job.material.kerf, 2.0);

    ASSERT_EQ(job.stock.size(), 2u);
    EXPECT_EQ(job.stock[0].quantity, 10);
    EXPECT_DOUBLE_EQ(job.stock[0].cost, 0.0);
    EXPECT_TRUE(job.stock[1].isUnlimited());
    EXPECT_DOUBLE_EQ(job.stock[1].cost, 2500.0);

    ASSERT_EQ(job.cuts.size(), 2u);
    EXPECT_EQ(job.cuts[0].label, "rail");
    EXPECT_EQ(job.cuts[1].quantity, 1);
    EXPECT_DOUBLE_EQ(job.cuts[1].length, 450.5);
}

TEST(JobFile, DefaultsForMissingIdAndMaterial) {
    auto result = JobFile().parse(kSample);
    ASSERT_TRUE(result);
    const Job& job = result.jobs[1];
    EXPECT_EQ(job.id, "job-2");
    EXPECT_EQ(job.material.id, "job-2");
    EXPECT_DOUBLE_EQ(job.material.kerf, 0.0);
}

TEST(JobFile, MalformedJson) {
    auto result = JobFile().parse("{ \"jobs\": [ ");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("JSON parse error"), std::string::npos);
}

TEST(JobFile, MissingJobsArray) {
    EXPECT_FALSE(JobFile().parse("{}"));
    EXPECT_FALSE(JobFile().parse("[1, 2]"));
    EXPECT_FALSE(JobFile().parse(R"({"jobs": {}})"));
}

TEST(JobFile, NewerFormatRejected) {
    auto result = JobFile().parse(R"({"format_version": 2, "jobs": []})");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("format_version"), std::string::npos);
}

TEST(JobFile, NonIntegerFormatVersionRejected) {
    auto result = JobFile().parse(R"({"format_version": "1", "jobs": []})");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("format_version"), std::string::npos);
    EXPECT_TRUE(result.jobs.empty());
}

TEST(JobFile, FractionalQuantityRejected) {
    auto cuts = JobFile().parse(R"({"jobs": [ {"cuts": [ {"length": 10, "quantity": 2.5} ]} ]})");
    EXPECT_FALSE(cuts);
    EXPECT_NE(cuts.error.find("Job #1"), std::string::npos);
    EXPECT_NE(cuts.error.find("quantity"), std::string::npos);

    auto stock = JobFile().parse(
        R"({"jobs": [ {"stock": [ {"id": "s", "length": 100, "quantity": 1.5} ]} ]})");
    EXPECT_FALSE(stock);
    EXPECT_TRUE(stock.jobs.empty());
}

TEST(JobFile, InvalidUtf8LabelStillSerializes) {
    Job job;
    job.id = "legacy";
    job.material = Material("steel-rod");
    job.stock = {StockOption("bar", 100.0)};
    job.cuts = {CutRequest(10.0, 1, "caf\xE9")};

    std::string text;
    ASSERT_NO_THROW(text = JobFile().serialize({job}));
    auto result = JobFile().parse(text);
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.jobs.size(), 1u);
    EXPECT_EQ(result.jobs[0].cuts[0].label, "caf\xEF\xBF\xBD");
}

TEST(JobFile, BadFieldNamesJob) {
    auto result = JobFile().parse(
        R"({"jobs": [ {"id": "ok"}, {"id": "bad", "stock": [ {"id": "s", "length": "long"} ]} ]})");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("Job #2"), std::string::npos);
    EXPECT_TRUE(result.jobs.empty());
}

TEST(JobFile, StockWithoutLengthRejected) {
    auto result = JobFile().parse(R"({"jobs": [ {"stock": [ {"id": "s"} ]} ]})");
    EXPECT_FALSE(result);
}

TEST(JobFile, SaveThenLoad) {
    auto dir = std::filesystem::temp_directory_path() / "rc_test_job_file";
    std::filesystem::create_directories(dir);
    Path path = dir / "jobs.json";

    Job job;
    job.id = "reel-job";
    job.material = Material("cable-3x1.5", 0.0);
    job.stock = {StockOption("R-17", 250.0, 1), StockOption("spool", 500.0)};
    job.cuts = {CutRequest(12.5, 8, "site A")};

    JobFile file;
    ASSERT_TRUE(file.save(path, {job}));

    auto result = file.load(path);
    ASSERT_TRUE(result) << result.error;
    ASSERT_EQ(result.jobs.size(), 1u);
    const Job& back = result.jobs[0];
    EXPECT_EQ(back.id, "reel-job");
    EXPECT_EQ(back.material.id, "cable-3x1.5");
    ASSERT_EQ(back.stock.size(), 2u);
    EXPECT_EQ(back.stock[0].quantity, 1);
    EXPECT_TRUE(back.stock[1].isUnlimited());
    ASSERT_EQ(back.cuts.size(), 1u);
    EXPECT_EQ(back.cuts[0].quantity, 8);
    EXPECT_EQ(back.cuts[0].label, "site A");

    std::filesystem::remove_all(dir);
}

TEST(JobFile, LoadMissingFile) {
    auto result = JobFile().load("/nonexistent/jobs.json");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("Failed to read"), std::string::npos);
}

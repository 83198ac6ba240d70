// Reelcut - Job Orchestrator Tests

#include <gtest/gtest.h>

#include <stdexcept>

#include "core/optimizer/job_orchestrator.h"

using namespace rc::optimizer;

namespace {

Job makeJob(const std::string& id, const std::string& material, double kerf,
            std::vector<StockOption> stock, std::vector<CutRequest> cuts) {
    Job job;
    job.id = id;
    job.material = Material(material, kerf);
    job.stock = std::move(stock);
    job.cuts = std::move(cuts);
    return job;
}

std::vector<Job> sampleBatch() {
    std::vector<Job> jobs;
    jobs.push_back(makeJob("j1", "steel", 0.0, {StockOption("bar", 100.0)},
                           {CutRequest(30.0, 3), CutRequest(40.0, 1)}));
    jobs.push_back(makeJob("j2", "copper", 2.0, {StockOption("reel", 50.0, 1)},
                           {CutRequest(25.0, 2)}));
    jobs.push_back(makeJob("j3", "steel", 0.0, {StockOption("bar", 100.0)},
                           {CutRequest(50.0, 2)}));
    return jobs;
}

// Throws while planning j2 and corrupts the recorded waste of j3
class FaultyOrchestrator : public JobOrchestrator {
  public:
    using JobOrchestrator::JobOrchestrator;

  protected:
    CuttingPlan buildPlan(const Job& job, AssemblerState& finalState) const override {
        if (job.id == "j2") {
            throw std::runtime_error("reel table unavailable");
        }
        CuttingPlan plan = JobOrchestrator::buildPlan(job, finalState);
        if (job.id == "j3" && !plan.assignments.empty()) {
            plan.assignments.back().leftover += 5.0;
        }
        return plan;
    }
};

void expectFaultsIsolated(const BatchReport& report) {
    ASSERT_EQ(report.results.size(), 3u);

    EXPECT_EQ(report.results[0].status, JobStatus::Ok);
    EXPECT_TRUE(report.results[0].isComplete());

    const JobResult& thrown = report.results[1];
    EXPECT_EQ(thrown.jobId, "j2");
    EXPECT_EQ(thrown.materialId, "copper");
    EXPECT_EQ(thrown.status, JobStatus::InternalInconsistency);
    EXPECT_FALSE(thrown.isComplete());
    ASSERT_EQ(thrown.errors.size(), 1u);
    EXPECT_NE(thrown.errors[0].find("reel table unavailable"), std::string::npos);

    const JobResult& corrupted = report.results[2];
    EXPECT_EQ(corrupted.jobId, "j3");
    EXPECT_EQ(corrupted.status, JobStatus::InternalInconsistency);
    ASSERT_FALSE(corrupted.errors.empty());
    EXPECT_EQ(corrupted.errors[0].rfind("waste_mismatch", 0), 0u);
    EXPECT_EQ(corrupted.unitsUsed, 1);

    EXPECT_EQ(report.completeJobs, 1);
    EXPECT_EQ(report.failedJobs, 2);
    EXPECT_FALSE(report.allComplete());
}

class JobOrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override { m_jobs = sampleBatch(); }

    std::vector<Job> m_jobs;
};

} // namespace

TEST_F(JobOrchestratorTest, ResultsKeepInputOrder) {
    JobOrchestrator orchestrator;
    BatchReport report = orchestrator.runBatch(m_jobs);

    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].jobId, "j1");
    EXPECT_EQ(report.results[1].jobId, "j2");
    EXPECT_EQ(report.results[2].jobId, "j3");
}

TEST_F(JobOrchestratorTest, StatisticsAndCounts) {
    JobOrchestrator orchestrator;
    BatchReport report = orchestrator.runBatch(m_jobs);

    const JobResult& j1 = report.results[0];
    EXPECT_EQ(j1.status, JobStatus::Ok);
    EXPECT_TRUE(j1.isComplete());
    EXPECT_EQ(j1.unitsUsed, 2);
    EXPECT_DOUBLE_EQ(j1.stockLength, 200.0);
    EXPECT_DOUBLE_EQ(j1.usedLength, 130.0);
    EXPECT_DOUBLE_EQ(j1.wasteLength, 70.0);
    EXPECT_DOUBLE_EQ(j1.efficiency(), 0.65);

    // One reel fits a single 25 piece: the second is short
    const JobResult& j2 = report.results[1];
    EXPECT_EQ(j2.status, JobStatus::Ok);
    EXPECT_FALSE(j2.isComplete());
    ASSERT_EQ(j2.plan.shortages.size(), 1u);
    EXPECT_EQ(j2.plan.shortages[0].reason, ShortageReason::StockExhausted);

    EXPECT_EQ(report.completeJobs, 2);
    EXPECT_EQ(report.partialJobs, 1);
    EXPECT_EQ(report.failedJobs, 0);
    EXPECT_FALSE(report.allComplete());
    EXPECT_EQ(report.unitsUsed, 4);
    EXPECT_DOUBLE_EQ(report.wasteLength, 70.0 + 25.0 + 0.0);
}

TEST_F(JobOrchestratorTest, TotalsPerMaterial) {
    JobOrchestrator orchestrator;
    BatchReport report = orchestrator.runBatch(m_jobs);

    ASSERT_EQ(report.materials.size(), 2u);
    EXPECT_EQ(report.materials[0].materialId, "steel");
    EXPECT_EQ(report.materials[0].jobs, 2);
    EXPECT_EQ(report.materials[0].unitsUsed, 3);
    EXPECT_DOUBLE_EQ(report.materials[0].wasteLength, 70.0);
    EXPECT_EQ(report.materials[1].materialId, "copper");
    EXPECT_EQ(report.materials[1].unitsUsed, 1);
}

TEST_F(JobOrchestratorTest, InvalidJobIsIsolated) {
    m_jobs.insert(m_jobs.begin() + 1,
                  makeJob("bad", "steel", 50.0, {StockOption("bar", 100.0)}, {CutRequest(30.0, 1)}));

    JobOrchestrator orchestrator;
    BatchReport report = orchestrator.runBatch(m_jobs);

    ASSERT_EQ(report.results.size(), 4u);
    EXPECT_EQ(report.results[1].status, JobStatus::InvalidInput);
    EXPECT_FALSE(report.results[1].errors.empty());
    EXPECT_TRUE(report.results[1].plan.assignments.empty());
    EXPECT_TRUE(report.results[0].isComplete());
    EXPECT_TRUE(report.results[3].isComplete());
    EXPECT_EQ(report.failedJobs, 1);
}

TEST_F(JobOrchestratorTest, ParallelMatchesSequential) {
    for (int i = 0; i < 20; ++i) {
        m_jobs.push_back(makeJob("extra-" + std::to_string(i), "alu", 1.0,
                                 {StockOption("s", 300.0 + i), StockOption("t", 250.0, 2)},
                                 {CutRequest(45.0 + i, 4), CutRequest(70.0, 3), CutRequest(12.5, 6)}));
    }

    JobOrchestrator sequential;
    BatchReport a = sequential.runBatch(m_jobs);

    OrchestratorOptions options;
    options.workerThreads = 4;
    JobOrchestrator parallel(options);
    BatchReport b = parallel.runBatch(m_jobs);

    ASSERT_EQ(a.results.size(), b.results.size());
    for (size_t i = 0; i < a.results.size(); ++i) {
        const auto& x = a.results[i];
        const auto& y = b.results[i];
        EXPECT_EQ(x.jobId, y.jobId);
        EXPECT_EQ(x.status, y.status);
        EXPECT_EQ(x.unitsUsed, y.unitsUsed);
        EXPECT_DOUBLE_EQ(x.wasteLength, y.wasteLength);
        ASSERT_EQ(x.plan.assignments.size(), y.plan.assignments.size());
        for (size_t k = 0; k < x.plan.assignments.size(); ++k) {
            EXPECT_EQ(x.plan.assignments[k].stockIndex, y.plan.assignments[k].stockIndex);
            EXPECT_EQ(x.plan.assignments[k].pattern.pieceCount(),
                      y.plan.assignments[k].pattern.pieceCount());
        }
    }
    EXPECT_EQ(a.unitsUsed, b.unitsUsed);
    EXPECT_DOUBLE_EQ(a.wasteLength, b.wasteLength);
}

TEST_F(JobOrchestratorTest, FailingJobsAreIsolatedSequentially) {
    FaultyOrchestrator orchestrator;
    expectFaultsIsolated(orchestrator.runBatch(m_jobs));
}

TEST_F(JobOrchestratorTest, FailingJobsAreIsolatedOnWorkers) {
    OrchestratorOptions options;
    options.workerThreads = 3;
    FaultyOrchestrator orchestrator(options);
    expectFaultsIsolated(orchestrator.runBatch(m_jobs));
}

TEST_F(JobOrchestratorTest, CancelBeforeRunSkipsEveryJob) {
    JobOrchestrator orchestrator;
    orchestrator.cancel();
    BatchReport report = orchestrator.runBatch(m_jobs);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.cancelledJobs, 3);
    EXPECT_EQ(report.unitsUsed, 0);
    for (const auto& r : report.results) {
        EXPECT_EQ(r.status, JobStatus::Cancelled);
        for (const auto& s : r.plan.shortages) {
            EXPECT_EQ(s.reason, ShortageReason::Cancelled);
        }
    }

    orchestrator.resetCancel();
    EXPECT_FALSE(orchestrator.isCancelled());
    EXPECT_EQ(orchestrator.runBatch(m_jobs).completeJobs, 2);
}

TEST_F(JobOrchestratorTest, ResultCarriesJobInputs) {
    JobOrchestrator orchestrator;
    JobResult result = orchestrator.runJob(m_jobs[1]);

    EXPECT_EQ(result.materialId, "copper");
    EXPECT_DOUBLE_EQ(result.kerf, 2.0);
    ASSERT_EQ(result.cuts.size(), 1u);
    ASSERT_EQ(result.stock.size(), 1u);
    EXPECT_EQ(result.stock[0].id, "reel");
    ASSERT_EQ(result.unitsPerStock.size(), 1u);
    EXPECT_EQ(result.unitsPerStock[0], 1);
}

TEST_F(JobOrchestratorTest, EmptyBatch) {
    JobOrchestrator orchestrator;
    BatchReport report = orchestrator.runBatch({});
    EXPECT_TRUE(report.results.empty());
    EXPECT_TRUE(report.allComplete());
    EXPECT_DOUBLE_EQ(report.efficiency(), 0.0);
}

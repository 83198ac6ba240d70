#pragma once

#include <string>
#include <vector>

#include "cancel_token.h"
#include "pattern_generator.h"
#include "plan_assembler.h"
#include "stock.h"

namespace rc {
namespace optimizer {

// Summed statistics of all jobs sharing a material id
struct MaterialTotals {
    std::string materialId;
    int jobs = 0;
    int unitsUsed = 0;
    f64 stockLength = 0.0;
    f64 usedLength = 0.0;
    f64 wasteLength = 0.0;
};

struct BatchReport {
    std::vector<JobResult> results;        // Same order as the input jobs
    std::vector<MaterialTotals> materials; // Order of first appearance

    int completeJobs = 0;
    int partialJobs = 0; // Ok status, plan partial
    int failedJobs = 0;  // InvalidInput or InternalInconsistency
    int cancelledJobs = 0;

    int unitsUsed = 0;
    f64 stockLength = 0.0;
    f64 usedLength = 0.0;
    f64 wasteLength = 0.0;

    bool cancelled = false;

    bool allComplete() const { return completeJobs == static_cast<int>(results.size()); }
    f64 efficiency() const { return stockLength > 0.0 ? usedLength / stockLength : 0.0; }
};

struct OrchestratorOptions {
    usize workerThreads = 1; // 0 or 1 runs jobs on the calling thread
    GeneratorLimits limits;
    usize maxStockVariants = kDefaultMaxStockVariants;
};

// Runs every job of a batch through input check, assembly and validation.
// Jobs never share mutable state; a failing job never affects the others.
// An exception escaping one job becomes that job's InternalInconsistency
// result.
class JobOrchestrator {
  public:
    JobOrchestrator() = default;
    explicit JobOrchestrator(OrchestratorOptions options) : m_options(options) {}
    virtual ~JobOrchestrator() = default;

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    BatchReport runBatch(const std::vector<Job>& jobs);

    // Full pipeline for one job, honoring the cancel flag. Never throws.
    JobResult runJob(const Job& job) const;

    // Thread-safe. Jobs not yet started are skipped, running jobs stop at
    // their next pattern selection. Stays set until resetCancel().
    void cancel() { m_cancel.cancel(); }
    void resetCancel() { m_cancel.reset(); }
    bool isCancelled() const { return m_cancel.isCancelled(); }

    const OrchestratorOptions& options() const { return m_options; }

  protected:
    // Assembly step of runJob(); `finalState` receives the assembler's state
    virtual CuttingPlan buildPlan(const Job& job, AssemblerState& finalState) const;

  private:
    JobResult runChecked(const Job& job) const;

    OrchestratorOptions m_options;
    CancelToken m_cancel;
};

// Result for a job the batch never started
JobResult makeCancelledResult(const Job& job);

} // namespace optimizer
} // namespace rc

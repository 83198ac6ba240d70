#include "job_orchestrator.h"

#include <algorithm>
#include <chrono>
#include <exception>

#include "../threading/thread_pool.h"
#include "../utils/log.h"
#include "plan_validator.h"

namespace rc {
namespace optimizer {

namespace {

void computeStatistics(const Job& job, JobResult& result) {
    result.unitsPerStock.assign(job.stock.size(), 0);
    result.unitsUsed = 0;
    result.stockLength = 0.0;
    result.usedLength = 0.0;
    result.wasteLength = 0.0;

    for (const auto& a : result.plan.assignments) {
        if (a.stockIndex >= job.stock.size()) {
            continue;
        }
        ++result.unitsPerStock[a.stockIndex];
        ++result.unitsUsed;
        result.stockLength += job.stock[a.stockIndex].length;
        result.usedLength += a.pattern.usedLength;
        result.wasteLength += a.pattern.waste;
    }
}

MaterialTotals& totalsFor(std::vector<MaterialTotals>& totals, const std::string& materialId) {
    for (auto& t : totals) {
        if (t.materialId == materialId) {
            return t;
        }
    }
    totals.push_back({});
    totals.back().materialId = materialId;
    return totals.back();
}

// Single-threaded merge once every job has finished
void aggregate(BatchReport& report) {
    for (const auto& r : report.results) {
        switch (r.status) {
        case JobStatus::Ok:
            if (r.plan.isComplete()) {
                ++report.completeJobs;
            } else {
                ++report.partialJobs;
            }
            break;
        case JobStatus::InvalidInput:
        case JobStatus::InternalInconsistency:
            ++report.failedJobs;
            break;
        case JobStatus::Cancelled:
            ++report.cancelledJobs;
            break;
        }

        MaterialTotals& totals = totalsFor(report.materials, r.materialId);
        ++totals.jobs;
        totals.unitsUsed += r.unitsUsed;
        totals.stockLength += r.stockLength;
        totals.usedLength += r.usedLength;
        totals.wasteLength += r.wasteLength;

        report.unitsUsed += r.unitsUsed;
        report.stockLength += r.stockLength;
        report.usedLength += r.usedLength;
        report.wasteLength += r.wasteLength;
    }
}

JobResult initResult(const Job& job) {
    JobResult result;
    result.jobId = job.id;
    result.materialId = job.material.id;
    result.kerf = job.material.kerf;
    result.cuts = job.cuts;
    result.stock = job.stock;
    result.unitsPerStock.assign(job.stock.size(), 0);
    return result;
}

} // namespace

JobResult makeCancelledResult(const Job& job) {
    JobResult result = initResult(job);
    result.status = JobStatus::Cancelled;
    result.plan.status = PlanStatus::Partial;
    for (usize i = 0; i < job.cuts.size(); ++i) {
        if (job.cuts[i].quantity > 0) {
            result.plan.shortages.push_back({i, job.cuts[i].quantity, ShortageReason::Cancelled});
        }
    }
    if (result.plan.shortages.empty()) {
        result.plan.status = PlanStatus::Complete;
    }
    return result;
}

CuttingPlan JobOrchestrator::buildPlan(const Job& job, AssemblerState& finalState) const {
    PlanAssembler assembler(m_options.limits, m_options.maxStockVariants);
    CuttingPlan plan = assembler.assemble(job, &m_cancel);
    finalState = assembler.lastState();
    return plan;
}

JobResult JobOrchestrator::runJob(const Job& job) const {
    try {
        return runChecked(job);
    } catch (const std::exception& e) {
        log::errorf("Orchestrator", "Job '%s' failed: %s", job.id.c_str(), e.what());
        JobResult result;
        result.jobId = job.id;
        result.materialId = job.material.id;
        result.kerf = job.material.kerf;
        result.status = JobStatus::InternalInconsistency;
        result.plan.status = PlanStatus::Partial;
        result.errors.push_back(std::string("exception: ") + e.what());
        return result;
    }
}

JobResult JobOrchestrator::runChecked(const Job& job) const {
    if (m_cancel.isCancelled()) {
        return makeCancelledResult(job);
    }

    JobResult result = initResult(job);

    auto problems = checkJobInput(job);
    if (!problems.empty()) {
        result.status = JobStatus::InvalidInput;
        result.errors = std::move(problems);
        for (const auto& p : result.errors) {
            log::warningf("Orchestrator", "Job '%s' rejected: %s", job.id.c_str(), p.c_str());
        }
        return result;
    }

    AssemblerState finalState = AssemblerState::PendingDemand;
    result.plan = buildPlan(job, finalState);

    auto violations = validatePlan(job, result.plan);
    if (!violations.empty()) {
        result.status = JobStatus::InternalInconsistency;
        for (const auto& v : violations) {
            log::errorf("Orchestrator", "Job '%s' plan inconsistent [%s]: %s", job.id.c_str(),
                        toString(v.kind), v.message.c_str());
            result.errors.push_back(std::string(toString(v.kind)) + ": " + v.message);
        }
    } else if (finalState == AssemblerState::Cancelled) {
        result.status = JobStatus::Cancelled;
    }

    computeStatistics(job, result);

    log::debugf("Orchestrator", "Job '%s' (%s): %s, %s, %d unit(s), waste %.3f", job.id.c_str(),
                job.material.id.c_str(), toString(result.status), toString(result.plan.status),
                result.unitsUsed, result.wasteLength);
    return result;
}

BatchReport JobOrchestrator::runBatch(const std::vector<Job>& jobs) {
    auto start = std::chrono::steady_clock::now();

    BatchReport report;
    report.results.resize(jobs.size());

    const usize threads = std::min(m_options.workerThreads, jobs.size());
    log::infof("Orchestrator", "Running %zu job(s) on %zu thread(s)", jobs.size(),
               std::max<usize>(1, threads));

    if (threads <= 1) {
        for (usize i = 0; i < jobs.size(); ++i) {
            report.results[i] = runJob(jobs[i]);
        }
    } else {
        ThreadPool pool(threads);
        for (usize i = 0; i < jobs.size(); ++i) {
            // Jobs are read-only here; each task writes only its own slot
            bool queued = pool.enqueue([this, &report, &jobs, i]() {
                report.results[i] = runJob(jobs[i]);
            });
            if (!queued) {
                report.results[i] = runJob(jobs[i]);
            }
        }
        pool.waitIdle();
        pool.shutdown();
    }

    aggregate(report);
    report.cancelled = m_cancel.isCancelled();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    log::infof("Orchestrator",
               "Batch done in %lld ms: %d complete, %d partial, %d failed, %d cancelled, "
               "%d unit(s), waste %.3f",
               static_cast<long long>(elapsed), report.completeJobs, report.partialJobs,
               report.failedJobs, report.cancelledJobs, report.unitsUsed, report.wasteLength);
    return report;
}

} // namespace optimizer
} // namespace rc

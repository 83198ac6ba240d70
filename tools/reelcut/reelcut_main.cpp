// reelcut: plan how to cut wire reels / stock bars into requested pieces.
//
// Usage:
//   reelcut --reels reels.csv --cuts cuts.csv [options]
//   reelcut --jobs jobs.json [options]
//
// Options:
//   --kerf K              default kerf for CSV input (overrides config)
//   --threads N           worker threads (overrides config)
//   --max-combinations N  pattern generator ceiling (overrides config)
//   --config FILE         INI configuration (default: reelcut.ini if present)
//   --out-assignments F   assignments CSV (item_number,serial,cut_length,label)
//   --out-summary F       per stock unit summary CSV
//   --out-shortages F     unassigned pieces CSV
//   --out-json F          full JSON report
//   --verbose             debug logging
//
// Exit code: 0 every job complete, 2 some job partial, 1 input error or
// inconsistent plan.

#include <cstdio>
#include <iostream>
#include <string>

#include "core/config/config.h"
#include "core/export/result_writer.h"
#include "core/loaders/csv_job_loader.h"
#include "core/loaders/job_file.h"
#include "core/optimizer/job_orchestrator.h"
#include "core/utils/log.h"
#include "core/utils/string_utils.h"

using namespace rc;

namespace {

struct Options {
    Path reels;
    Path cuts;
    Path jobs;
    Path config = "reelcut.ini";
    Path outAssignments;
    Path outSummary;
    Path outShortages;
    Path outJson;
    bool hasKerf = false;
    double kerf = 0.0;
    int threads = -1;
    int maxCombinations = 0;
    bool verbose = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --reels REELS.csv --cuts CUTS.csv [options]\n"
              << "       " << argv0 << " --jobs JOBS.json [options]\n"
              << "Options: --kerf K --threads N --max-combinations N --config FILE\n"
              << "         --out-assignments F --out-summary F --out-shortages F --out-json F\n"
              << "         --verbose\n";
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " needs a value\n";
            return false;
        }
        const std::string value = argv[++i];

        if (arg == "--reels") {
            opts.reels = value;
        } else if (arg == "--cuts") {
            opts.cuts = value;
        } else if (arg == "--jobs") {
            opts.jobs = value;
        } else if (arg == "--config") {
            opts.config = value;
        } else if (arg == "--out-assignments") {
            opts.outAssignments = value;
        } else if (arg == "--out-summary") {
            opts.outSummary = value;
        } else if (arg == "--out-shortages") {
            opts.outShortages = value;
        } else if (arg == "--out-json") {
            opts.outJson = value;
        } else if (arg == "--kerf") {
            if (!str::parseDouble(value, opts.kerf) || opts.kerf < 0.0) {
                std::cerr << "Error: invalid kerf '" << value << "'\n";
                return false;
            }
            opts.hasKerf = true;
        } else if (arg == "--threads") {
            if (!str::parseInt(value, opts.threads) || opts.threads < 0) {
                std::cerr << "Error: invalid thread count '" << value << "'\n";
                return false;
            }
        } else if (arg == "--max-combinations") {
            if (!str::parseInt(value, opts.maxCombinations) || opts.maxCombinations < 1) {
                std::cerr << "Error: invalid combination ceiling '" << value << "'\n";
                return false;
            }
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        }
    }

    const bool csvInput = !opts.reels.empty() || !opts.cuts.empty();
    if (csvInput == !opts.jobs.empty()) {
        std::cerr << "Error: give either --reels and --cuts, or --jobs\n";
        return false;
    }
    if (csvInput && (opts.reels.empty() || opts.cuts.empty())) {
        std::cerr << "Error: --reels and --cuts must be given together\n";
        return false;
    }
    return true;
}

void printReport(const optimizer::BatchReport& report) {
    for (const auto& r : report.results) {
        std::printf("%-20s %-10s %-8s units=%-4d used=%-12s waste=%-12s eff=%5.1f%%\n",
                    r.jobId.c_str(), optimizer::toString(r.status),
                    optimizer::toString(r.plan.status), r.unitsUsed,
                    str::formatLength(r.usedLength).c_str(),
                    str::formatLength(r.wasteLength).c_str(), r.efficiency() * 100.0);
        for (const auto& s : r.plan.shortages) {
            const double length = s.requestIndex < r.cuts.size() ? r.cuts[s.requestIndex].length
                                                                  : 0.0;
            std::printf("    short %d x %s (%s)\n", s.quantity, str::formatLength(length).c_str(),
                        optimizer::toString(s.reason));
        }
        for (const auto& e : r.errors) {
            std::printf("    error: %s\n", e.c_str());
        }
    }

    std::printf("\nDone: %d complete, %d partial, %d failed, %d cancelled (out of %zu jobs)\n",
                report.completeJobs, report.partialJobs, report.failedJobs,
                report.cancelledJobs, report.results.size());
    std::printf("Stock used: %d unit(s), %s length, waste %s, efficiency %.1f%%\n",
                report.unitsUsed, str::formatLength(report.stockLength).c_str(),
                str::formatLength(report.wasteLength).c_str(), report.efficiency() * 100.0);
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    Config config;
    if (!config.load(opts.config)) {
        std::cerr << "Error: could not read config " << opts.config << "\n";
        return 1;
    }

    log::setLevel(opts.verbose ? log::Level::Debug : log::levelFromInt(config.getLogLevel()));
    if (!config.getLogFilePath().empty()) {
        log::setLogFile(config.getLogFilePath().string());
    }

    if (opts.threads >= 0) {
        config.setThreads(opts.threads);
    }
    if (opts.maxCombinations > 0) {
        config.setMaxCombinations(static_cast<usize>(opts.maxCombinations));
    }
    if (opts.hasKerf) {
        config.setDefaultKerf(opts.kerf);
    }

    JobLoadResult loaded;
    if (!opts.jobs.empty()) {
        loaded = JobFile().load(opts.jobs);
    } else {
        CsvJobLoader loader;
        loader.setDefaultKerf(config.getDefaultKerf());
        loaded = loader.load(opts.reels, opts.cuts);
    }
    if (!loaded) {
        std::cerr << "Error: " << loaded.error << "\n";
        return 1;
    }

    optimizer::OrchestratorOptions orchestratorOptions;
    orchestratorOptions.workerThreads = config.resolveThreadCount();
    orchestratorOptions.limits.maxCombinations = config.getMaxCombinations();
    orchestratorOptions.maxStockVariants = config.getMaxStockVariants();

    optimizer::JobOrchestrator orchestrator(orchestratorOptions);
    auto report = orchestrator.runBatch(loaded.jobs);

    printReport(report);

    ResultWriter writer;
    bool writeFailed = false;
    auto check = [&writeFailed](const ExportResult& r) {
        if (!r.success) {
            std::cerr << "Error: " << r.error << "\n";
            writeFailed = true;
        }
    };
    if (!opts.outAssignments.empty()) {
        check(writer.writeAssignments(report, opts.outAssignments));
    }
    if (!opts.outSummary.empty()) {
        check(writer.writeSummary(report, opts.outSummary));
    }
    if (!opts.outShortages.empty()) {
        check(writer.writeShortages(report, opts.outShortages));
    }
    if (!opts.outJson.empty()) {
        check(writer.writeJson(report, opts.outJson));
    }

    if (writeFailed || report.failedJobs > 0) {
        return 1;
    }
    return report.allComplete() ? 0 : 2;
}

#include "result_writer.h"

#include <nlohmann/json.hpp>

#include "../utils/csv.h"
#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace rc {

using json = nlohmann::json;
using optimizer::BatchReport;
using optimizer::JobResult;

namespace {

void appendRow(std::string& out, const std::vector<std::string>& fields) {
    out += csv::formatRow(fields);
    out += '\n';
}

const std::string& stockId(const JobResult& r, usize stockIndex) {
    static const std::string kUnknown = "?";
    return stockIndex < r.stock.size() ? r.stock[stockIndex].id : kUnknown;
}

json resultToJson(const JobResult& r) {
    json j;
    j["id"] = r.jobId;
    j["material"] = r.materialId;
    j["kerf"] = r.kerf;
    j["status"] = optimizer::toString(r.status);
    j["plan_status"] = optimizer::toString(r.plan.status);
    j["errors"] = r.errors;

    j["units_used"] = r.unitsUsed;
    j["stock_length"] = r.stockLength;
    j["used_length"] = r.usedLength;
    j["waste_length"] = r.wasteLength;
    j["efficiency"] = r.efficiency();

    auto& assignments = j["assignments"];
    assignments = json::array();
    for (const auto& a : r.plan.assignments) {
        json pieces = json::array();
        for (const auto& p : a.pattern.pieces) {
            json piece = {{"request", p.requestIndex}, {"count", p.count}};
            if (p.requestIndex < r.cuts.size()) {
                piece["length"] = r.cuts[p.requestIndex].length;
                if (!r.cuts[p.requestIndex].label.empty()) {
                    piece["label"] = r.cuts[p.requestIndex].label;
                }
            }
            pieces.push_back(piece);
        }
        assignments.push_back({{"stock", stockId(r, a.stockIndex)},
                               {"used_length", a.pattern.usedLength},
                               {"leftover", a.leftover},
                               {"pieces", pieces}});
    }

    auto& shortages = j["shortages"];
    shortages = json::array();
    for (const auto& s : r.plan.shortages) {
        json entry = {{"request", s.requestIndex},
                      {"quantity", s.quantity},
                      {"reason", optimizer::toString(s.reason)}};
        if (s.requestIndex < r.cuts.size()) {
            entry["length"] = r.cuts[s.requestIndex].length;
        }
        shortages.push_back(entry);
    }
    return j;
}

} // namespace

std::string ResultWriter::assignmentsCsv(const BatchReport& report) const {
    std::string out;
    appendRow(out, {"item_number", "serial", "cut_length", "label"});
    for (const auto& r : report.results) {
        for (const auto& a : r.plan.assignments) {
            for (const auto& p : a.pattern.pieces) {
                if (p.requestIndex >= r.cuts.size()) {
                    continue;
                }
                const auto& cut = r.cuts[p.requestIndex];
                for (int n = 0; n < p.count; ++n) {
                    appendRow(out, {r.materialId, stockId(r, a.stockIndex),
                                    str::formatLength(cut.length), cut.label});
                }
            }
        }
    }
    return out;
}

std::string ResultWriter::summaryCsv(const BatchReport& report) const {
    std::string out;
    appendRow(out, {"job_id", "item_number", "serial", "unit", "stock_length", "used_length",
                    "leftover", "pieces"});
    for (const auto& r : report.results) {
        std::vector<int> unitNumber(r.stock.size(), 0);
        for (const auto& a : r.plan.assignments) {
            int unit = 0;
            f64 length = 0.0;
            if (a.stockIndex < r.stock.size()) {
                unit = ++unitNumber[a.stockIndex];
                length = r.stock[a.stockIndex].length;
            }
            appendRow(out, {r.jobId, r.materialId, stockId(r, a.stockIndex), std::to_string(unit),
                            str::formatLength(length), str::formatLength(a.pattern.usedLength),
                            str::formatLength(a.leftover),
                            std::to_string(a.pattern.pieceCount())});
        }
    }
    return out;
}

std::string ResultWriter::shortagesCsv(const BatchReport& report) const {
    std::string out;
    appendRow(out, {"job_id", "item_number", "cut_length", "label", "quantity", "reason"});
    for (const auto& r : report.results) {
        for (const auto& s : r.plan.shortages) {
            std::string length;
            std::string label;
            if (s.requestIndex < r.cuts.size()) {
                length = str::formatLength(r.cuts[s.requestIndex].length);
                label = r.cuts[s.requestIndex].label;
            }
            appendRow(out, {r.jobId, r.materialId, length, label, std::to_string(s.quantity),
                            optimizer::toString(s.reason)});
        }
    }
    return out;
}

std::string ResultWriter::reportJson(const BatchReport& report) const {
    json doc;
    doc["cancelled"] = report.cancelled;

    doc["totals"] = {{"jobs", report.results.size()},
                     {"complete", report.completeJobs},
                     {"partial", report.partialJobs},
                     {"failed", report.failedJobs},
                     {"cancelled", report.cancelledJobs},
                     {"units_used", report.unitsUsed},
                     {"stock_length", report.stockLength},
                     {"used_length", report.usedLength},
                     {"waste_length", report.wasteLength},
                     {"efficiency", report.efficiency()}};

    auto& materials = doc["materials"];
    materials = json::array();
    for (const auto& m : report.materials) {
        materials.push_back({{"id", m.materialId},
                             {"jobs", m.jobs},
                             {"units_used", m.unitsUsed},
                             {"stock_length", m.stockLength},
                             {"used_length", m.usedLength},
                             {"waste_length", m.wasteLength}});
    }

    auto& jobs = doc["jobs"];
    jobs = json::array();
    for (const auto& r : report.results) {
        jobs.push_back(resultToJson(r));
    }
    // Labels are raw bytes from the input; invalid UTF-8 becomes U+FFFD
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

ExportResult ResultWriter::writeFile(const Path& path, const std::string& content,
                                     const char* what) const {
    ExportResult result;
    if (path.has_parent_path() && !file::createDirectories(path.parent_path())) {
        result.error = "Cannot create directory for " + path.string();
        return result;
    }
    if (!file::writeText(path, content)) {
        result.error = "Failed to write " + path.string();
        log::errorf("Export", "%s", result.error.c_str());
        return result;
    }
    log::infof("Export", "Wrote %s to %s", what, path.string().c_str());
    result.success = true;
    return result;
}

ExportResult ResultWriter::writeAssignments(const BatchReport& report, const Path& path) const {
    return writeFile(path, assignmentsCsv(report), "assignments");
}

ExportResult ResultWriter::writeSummary(const BatchReport& report, const Path& path) const {
    return writeFile(path, summaryCsv(report), "stock summary");
}

ExportResult ResultWriter::writeShortages(const BatchReport& report, const Path& path) const {
    return writeFile(path, shortagesCsv(report), "shortages");
}

ExportResult ResultWriter::writeJson(const BatchReport& report, const Path& path) const {
    return writeFile(path, reportJson(report), "JSON report");
}

} // namespace rc

#pragma once

#include <string>

#include "../optimizer/job_orchestrator.h"
#include "../types.h"

namespace rc {

struct ExportResult {
    bool success = false;
    std::string error;
};

// Writes a finished batch in the formats shop floor and downstream tools use.
//
//   assignments  item_number,serial,cut_length,label   one row per piece
//   summary      job_id,item_number,serial,unit,stock_length,used_length,leftover,pieces
//   shortages    job_id,item_number,cut_length,label,quantity,reason
//   json         full report including statistics and per-job errors
class ResultWriter {
  public:
    std::string assignmentsCsv(const optimizer::BatchReport& report) const;
    std::string summaryCsv(const optimizer::BatchReport& report) const;
    std::string shortagesCsv(const optimizer::BatchReport& report) const;
    std::string reportJson(const optimizer::BatchReport& report) const;

    ExportResult writeAssignments(const optimizer::BatchReport& report, const Path& path) const;
    ExportResult writeSummary(const optimizer::BatchReport& report, const Path& path) const;
    ExportResult writeShortages(const optimizer::BatchReport& report, const Path& path) const;
    ExportResult writeJson(const optimizer::BatchReport& report, const Path& path) const;

  private:
    ExportResult writeFile(const Path& path, const std::string& content, const char* what) const;
};

} // namespace rc

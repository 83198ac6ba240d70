#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../optimizer/stock.h"
#include "../types.h"
#include "job_load_result.h"

namespace rc {

// One physical reel (stock unit) from the reels table
struct ReelRow {
    std::string serial;
    std::string itemNumber;
    f64 length = 0.0;
};

// One requested piece from the cuts table
struct CutRow {
    std::string itemNumber;
    f64 length = 0.0;
    std::string label;
};

// Builds jobs from the reel and cut tables used on the shop floor.
//
// Reels CSV columns: serial, item_number, length (any order, extra columns ignored).
// Cuts CSV columns:  item_number, length, optional label.
//
// Every item number in the cuts table becomes one job (material id = item
// number), in order of first appearance. Each reel becomes a stock option
// with quantity 1 and id = serial. Identical (length, label) cuts of one item
// are merged into a single request.
class CsvJobLoader {
  public:
    void setDefaultKerf(f64 kerf) { m_kerf = kerf; }
    f64 defaultKerf() const { return m_kerf; }

    JobLoadResult load(const Path& reelsPath, const Path& cutsPath);
    JobLoadResult loadFromStrings(std::string_view reelsCsv, std::string_view cutsCsv);

    // Rows accepted by the last load
    const std::vector<ReelRow>& reels() const { return m_reels; }
    const std::vector<CutRow>& cuts() const { return m_cuts; }

  private:
    bool parseReels(std::string_view text, std::vector<std::string>& errors);
    bool parseCuts(std::string_view text, std::vector<std::string>& errors);
    std::vector<optimizer::Job> buildJobs() const;

    f64 m_kerf = 0.0;
    std::vector<ReelRow> m_reels;
    std::vector<CutRow> m_cuts;
};

} // namespace rc

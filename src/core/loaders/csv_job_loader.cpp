#include "csv_job_loader.h"

#include <algorithm>

#include "../utils/csv.h"
#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace rc {

namespace {

constexpr usize kMaxReportedErrors = 20;

std::string joinErrors(const std::vector<std::string>& errors) {
    std::vector<std::string> shown(errors.begin(),
                                   errors.begin() +
                                       static_cast<long>(std::min(errors.size(), kMaxReportedErrors)));
    std::string out = str::join(shown, "\n");
    if (errors.size() > kMaxReportedErrors) {
        out += "\n... " + std::to_string(errors.size() - kMaxReportedErrors) + " more";
    }
    return out;
}

std::string field(const std::vector<std::string>& row, int column) {
    if (column < 0 || column >= static_cast<int>(row.size())) {
        return {};
    }
    return row[static_cast<size_t>(column)];
}

// Positive finite length or an error message
bool parseLength(const std::string& text, f64& out, std::string& error) {
    double value = 0.0;
    if (!str::parseDouble(text, value)) {
        error = "length '" + text + "' is not a number";
        return false;
    }
    if (value <= 0.0) {
        error = "length " + text + " must be positive";
        return false;
    }
    out = value;
    return true;
}

bool requireColumns(const csv::Table& table, const char* tableName,
                    const std::vector<const char*>& names, std::vector<std::string>& errors) {
    bool ok = true;
    for (const char* name : names) {
        if (table.column(name) < 0) {
            errors.push_back(std::string(tableName) + ": missing required column '" + name + "'");
            ok = false;
        }
    }
    return ok;
}

} // namespace

JobLoadResult CsvJobLoader::load(const Path& reelsPath, const Path& cutsPath) {
    JobLoadResult result;

    auto reelsText = file::readText(reelsPath);
    if (!reelsText) {
        result.error = "Failed to read reels file: " + reelsPath.string();
        return result;
    }
    auto cutsText = file::readText(cutsPath);
    if (!cutsText) {
        result.error = "Failed to read cuts file: " + cutsPath.string();
        return result;
    }

    result = loadFromStrings(*reelsText, *cutsText);
    if (result) {
        log::infof("CsvLoader", "Loaded %zu reel(s) and %zu cut(s) into %zu job(s)",
                   m_reels.size(), m_cuts.size(), result.jobs.size());
    }
    return result;
}

JobLoadResult CsvJobLoader::loadFromStrings(std::string_view reelsCsv, std::string_view cutsCsv) {
    m_reels.clear();
    m_cuts.clear();

    JobLoadResult result;
    std::vector<std::string> errors;
    bool ok = parseReels(reelsCsv, errors);
    ok = parseCuts(cutsCsv, errors) && ok;

    if (!ok) {
        for (const auto& e : errors) {
            log::error("CsvLoader", e);
        }
        result.error = joinErrors(errors);
        return result;
    }

    result.jobs = buildJobs();
    return result;
}

bool CsvJobLoader::parseReels(std::string_view text, std::vector<std::string>& errors) {
    const auto table = csv::parse(text);
    if (!requireColumns(table, "reels", {"serial", "item_number", "length"}, errors)) {
        return false;
    }

    const int serialCol = table.column("serial");
    const int itemCol = table.column("item_number");
    const int lengthCol = table.column("length");

    bool ok = true;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const std::string where = "reels line " + std::to_string(table.lineNumbers[r]) + ": ";

        ReelRow reel;
        reel.serial = field(row, serialCol);
        reel.itemNumber = field(row, itemCol);

        std::string error;
        if (reel.serial.empty()) {
            errors.push_back(where + "empty serial");
            ok = false;
            continue;
        }
        if (reel.itemNumber.empty()) {
            errors.push_back(where + "empty item_number");
            ok = false;
            continue;
        }
        if (!parseLength(field(row, lengthCol), reel.length, error)) {
            errors.push_back(where + error);
            ok = false;
            continue;
        }
        m_reels.push_back(std::move(reel));
    }
    return ok;
}

bool CsvJobLoader::parseCuts(std::string_view text, std::vector<std::string>& errors) {
    const auto table = csv::parse(text);
    if (!requireColumns(table, "cuts", {"item_number", "length"}, errors)) {
        return false;
    }

    const int itemCol = table.column("item_number");
    const int lengthCol = table.column("length");
    const int labelCol = table.column("label");

    bool ok = true;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const std::string where = "cuts line " + std::to_string(table.lineNumbers[r]) + ": ";

        CutRow cut;
        cut.itemNumber = field(row, itemCol);
        cut.label = field(row, labelCol);

        std::string error;
        if (cut.itemNumber.empty()) {
            errors.push_back(where + "empty item_number");
            ok = false;
            continue;
        }
        if (!parseLength(field(row, lengthCol), cut.length, error)) {
            errors.push_back(where + error);
            ok = false;
            continue;
        }
        m_cuts.push_back(std::move(cut));
    }
    return ok;
}

std::vector<optimizer::Job> CsvJobLoader::buildJobs() const {
    std::vector<optimizer::Job> jobs;

    auto jobFor = [&jobs, this](const std::string& item) -> optimizer::Job& {
        for (auto& job : jobs) {
            if (job.id == item) {
                return job;
            }
        }
        jobs.emplace_back();
        jobs.back().id = item;
        jobs.back().material = optimizer::Material(item, m_kerf);
        return jobs.back();
    };

    for (const auto& cut : m_cuts) {
        optimizer::Job& job = jobFor(cut.itemNumber);
        bool merged = false;
        for (auto& request : job.cuts) {
            if (request.length == cut.length && request.label == cut.label) {
                ++request.quantity;
                merged = true;
                break;
            }
        }
        if (!merged) {
            job.cuts.emplace_back(cut.length, 1, cut.label);
        }
    }

    // Reels of items nobody asked for are not jobs
    for (const auto& reel : m_reels) {
        for (auto& job : jobs) {
            if (job.id == reel.itemNumber) {
                job.stock.emplace_back(reel.serial, reel.length, 1);
                break;
            }
        }
    }

    for (const auto& job : jobs) {
        if (job.stock.empty()) {
            log::warningf("CsvLoader", "Item '%s' has cuts but no reels", job.id.c_str());
        }
    }
    return jobs;
}

} // namespace rc

#include "job_file.h"

#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace rc {

using json = nlohmann::json;

namespace {

// Whole-number field; fractional or out-of-range values are rejected
int integerField(const json& j, const char* key, int fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("\"") + key + "\" must be an integer, got " +
                                    value.dump(-1, ' ', false, json::error_handler_t::replace));
    }
    const i64 n = value.get<i64>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string("\"") + key + "\" out of range: " +
                                    std::to_string(n));
    }
    return static_cast<int>(n);
}

optimizer::Job jobFromJson(const json& j, usize index) {
    optimizer::Job job;
    job.id = j.value("id", "job-" + std::to_string(index + 1));

    if (j.contains("material")) {
        const auto& m = j.at("material");
        job.material.id = m.value("id", job.id);
        job.material.kerf = m.value("kerf", 0.0);
    } else {
        job.material.id = job.id;
    }

    if (j.contains("stock")) {
        for (const auto& s : j.at("stock")) {
            optimizer::StockOption option;
            option.id = s.at("id").get<std::string>();
            option.length = s.at("length").get<double>();
            option.quantity = integerField(s, "quantity", optimizer::kUnlimitedQuantity);
            option.cost = s.value("cost", 0.0);
            job.stock.push_back(option);
        }
    }

    if (j.contains("cuts")) {
        for (const auto& c : j.at("cuts")) {
            optimizer::CutRequest request;
            request.length = c.at("length").get<double>();
            request.quantity = integerField(c, "quantity", 1);
            request.label = c.value("label", std::string{});
            job.cuts.push_back(request);
        }
    }
    return job;
}

json jobToJson(const optimizer::Job& job) {
    json j;
    j["id"] = job.id;
    j["material"] = {{"id", job.material.id}, {"kerf", job.material.kerf}};

    auto& stockArr = j["stock"];
    stockArr = json::array();
    for (const auto& s : job.stock) {
        json option = {{"id", s.id}, {"length", s.length}, {"quantity", s.quantity}};
        if (s.cost > 0.0) {
            option["cost"] = s.cost;
        }
        stockArr.push_back(option);
    }

    auto& cutsArr = j["cuts"];
    cutsArr = json::array();
    for (const auto& c : job.cuts) {
        json cut = {{"length", c.length}, {"quantity", c.quantity}};
        if (!c.label.empty()) {
            cut["label"] = c.label;
        }
        cutsArr.push_back(cut);
    }
    return j;
}

} // namespace

JobLoadResult JobFile::load(const Path& path) const {
    auto text = file::readText(path);
    if (!text) {
        JobLoadResult result;
        result.error = "Failed to read job file: " + path.string();
        return result;
    }

    auto result = parse(*text);
    if (result) {
        log::infof("JobFile", "Loaded %zu job(s) from %s", result.jobs.size(),
                   path.string().c_str());
    } else {
        log::errorf("JobFile", "%s: %s", path.string().c_str(), result.error.c_str());
    }
    return result;
}

JobLoadResult JobFile::parse(const std::string& text) const {
    JobLoadResult result;

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    if (!doc.is_object()) {
        result.error = "Job file must be a JSON object";
        return result;
    }

    // Type errors anywhere below reject the file rather than escape
    try {
        const int version = integerField(doc, "format_version", kFormatVersion);
        if (version > kFormatVersion) {
            result.error = "Unsupported format_version " + std::to_string(version);
            return result;
        }

        if (!doc.contains("jobs") || !doc["jobs"].is_array()) {
            result.error = "Job file has no \"jobs\" array";
            return result;
        }

        const auto& jobs = doc["jobs"];
        for (usize i = 0; i < jobs.size(); ++i) {
            try {
                result.jobs.push_back(jobFromJson(jobs[i], i));
            } catch (const std::exception& e) {
                result.jobs.clear();
                result.error = "Job #" + std::to_string(i + 1) + ": " + e.what();
                return result;
            }
        }
    } catch (const std::exception& e) {
        result.jobs.clear();
        result.error = std::string("Invalid job file: ") + e.what();
    }
    return result;
}

std::string JobFile::serialize(const std::vector<optimizer::Job>& jobs) const {
    json doc;
    doc["format_version"] = kFormatVersion;
    auto& jobsArr = doc["jobs"];
    jobsArr = json::array();
    for (const auto& job : jobs) {
        jobsArr.push_back(jobToJson(job));
    }
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

bool JobFile::save(const Path& path, const std::vector<optimizer::Job>& jobs) const {
    if (!file::writeText(path, serialize(jobs))) {
        log::errorf("JobFile", "Failed to write %s", path.string().c_str());
        return false;
    }
    log::infof("JobFile", "Saved %zu job(s) to %s", jobs.size(), path.string().c_str());
    return true;
}

} // namespace rc

#include "config.h"

#include <sstream>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace rc {

bool Config::load(const Path& path) {
    if (!file::exists(path)) {
        log::infof("Config", "No config file at %s, using defaults", path.string().c_str());
        return true;
    }

    auto content = file::readText(path);
    if (!content) {
        log::error("Config", "Failed to read config file");
        return false;
    }

    loadFromString(*content);
    log::infof("Config", "Loaded from %s", path.string().c_str());
    return true;
}

void Config::loadFromString(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        line = str::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            section = str::toLower(str::trim(line.substr(1, line.length() - 2)));
            continue;
        }

        // Key=Value pair
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = str::trim(line.substr(0, pos));
        std::string value = str::trim(line.substr(pos + 1));

        // Strip trailing inline comment
        auto comment = value.find(" ;");
        if (comment != std::string::npos) {
            value = str::trim(value.substr(0, comment));
        }

        if (section == "optimizer") {
            if (key == "max_combinations") {
                int64_t n = 0;
                if (str::parseInt64(value, n) && n > 0) {
                    m_maxCombinations = static_cast<usize>(n);
                } else {
                    log::warningf("Config", "Ignoring invalid max_combinations '%s'",
                                  value.c_str());
                }
            } else if (key == "max_stock_variants") {
                int64_t n = 0;
                if (str::parseInt64(value, n) && n > 0) {
                    m_maxStockVariants = static_cast<usize>(n);
                } else {
                    log::warningf("Config", "Ignoring invalid max_stock_variants '%s'",
                                  value.c_str());
                }
            } else if (key == "default_kerf") {
                double kerf = 0.0;
                if (str::parseDouble(value, kerf) && kerf >= 0.0) {
                    m_defaultKerf = kerf;
                } else {
                    log::warningf("Config", "Ignoring invalid default_kerf '%s'", value.c_str());
                }
            }
        } else if (section == "batch") {
            if (key == "parallelism") {
                int tier = 0;
                if (str::parseInt(value, tier) && tier >= 0 && tier <= 2) {
                    m_parallelismTier = static_cast<ParallelismTier>(tier);
                }
            } else if (key == "threads") {
                int threads = 0;
                if (str::parseInt(value, threads) && threads >= 0) {
                    m_threads = threads;
                }
            }
        } else if (section == "logging") {
            if (key == "level") {
                str::parseInt(value, m_logLevel);
            } else if (key == "file") {
                m_logFilePath = value;
            }
        }
    }
}

std::string Config::toString() const {
    std::ostringstream ss;

    ss << "# Reelcut Configuration\n\n";

    ss << "[optimizer]\n";
    ss << "max_combinations=" << m_maxCombinations << "\n";
    ss << "max_stock_variants=" << m_maxStockVariants << "\n";
    ss << "default_kerf=" << str::formatLength(m_defaultKerf) << "\n";
    ss << "\n";

    ss << "[batch]\n";
    ss << "parallelism=" << static_cast<int>(m_parallelismTier) << "\n";
    ss << "threads=" << m_threads << "\n";
    ss << "\n";

    ss << "[logging]\n";
    ss << "level=" << m_logLevel << "\n";
    ss << "file=" << m_logFilePath.string() << "\n";

    return ss.str();
}

bool Config::save(const Path& path) const {
    if (!file::createDirectories(path.parent_path())) {
        log::error("Config", "Failed to create config directory");
        return false;
    }

    if (!file::writeText(path, toString())) {
        log::errorf("Config", "Failed to write %s", path.string().c_str());
        return false;
    }

    log::infof("Config", "Saved to %s", path.string().c_str());
    return true;
}

usize Config::resolveThreadCount() const {
    if (m_threads > 0) {
        return static_cast<usize>(m_threads);
    }
    return calculateThreadCount(m_parallelismTier);
}

} // namespace rc

#include "csv.h"

#include <sstream>

#include "string_utils.h"

namespace rc {
namespace csv {

int Table::column(std::string_view name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<std::string> parseLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;
    bool wasQuoted = false;

    auto finishField = [&]() {
        fields.push_back(wasQuoted ? current : str::trim(current));
        current.clear();
        wasQuoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            // Opening quote: drop any whitespace collected before it
            current.clear();
            inQuotes = true;
            wasQuoted = true;
        } else if (c == ',') {
            finishField();
        } else if (!wasQuoted) {
            current += c;
        }
    }
    finishField();
    return fields;
}

Table parse(std::string_view text) {
    Table table;
    std::string content(text);
    std::istringstream stream(content);
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Strip a UTF-8 byte order mark on the first line
        if (lineNumber == 1 && str::startsWith(line, "\xEF\xBB\xBF")) {
            line = line.substr(3);
        }
        if (str::trim(line).empty()) {
            continue;
        }

        auto fields = parseLine(line);
        if (table.header.empty()) {
            for (auto& f : fields) {
                std::string name = str::toLower(str::trim(f));
                for (char& c : name) {
                    if (c == ' ') {
                        c = '_';
                    }
                }
                table.header.push_back(name);
            }
            continue;
        }
        table.rows.push_back(std::move(fields));
        table.lineNumbers.push_back(lineNumber);
    }
    return table;
}

std::string escapeField(std::string_view field) {
    if (field.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string formatRow(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += escapeField(fields[i]);
    }
    return out;
}

} // namespace csv
} // namespace rc

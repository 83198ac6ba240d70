#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rc {
namespace csv {

// A parsed table: the first non-empty line is the header, column names are
// trimmed, lower-cased and have spaces replaced by '_' ("Item Number" ->
// "item_number"). Line numbers are 1-based positions in the input.
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> lineNumbers; // Parallel to rows

    // Index of a column by (lower-case) name, or -1
    int column(std::string_view name) const;
};

// Split one line into fields. Supports double-quoted fields with "" escapes;
// quoted fields cannot span lines. Fields are trimmed outside quotes.
std::vector<std::string> parseLine(std::string_view line);

// Parse a whole document. Blank lines are skipped.
Table parse(std::string_view text);

// Quote a field if it contains a separator, quote or newline
std::string escapeField(std::string_view field);

// Join fields into one line (no trailing newline)
std::string formatRow(const std::vector<std::string>& fields);

} // namespace csv
} // namespace rc

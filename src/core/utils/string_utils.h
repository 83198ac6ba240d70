#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rc {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Case conversion
std::string toLower(std::string_view s);

// Split string by delimiter (empty fields are dropped)
std::vector<std::string> split(std::string_view s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

// Check prefix
bool startsWith(std::string_view s, std::string_view prefix);

// Parse number from string. The whole string must be consumed; out is
// left untouched on failure.
bool parseInt(std::string_view s, int& out);
bool parseInt64(std::string_view s, int64_t& out);
bool parseDouble(std::string_view s, double& out);

// Format a length with up to 3 decimals, trailing zeros removed ("12.5", "40")
std::string formatLength(double value);

} // namespace str
} // namespace rc

#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace rc {
namespace str {

std::string trim(std::string_view s) {
    return trimRight(trimLeft(s));
}

std::string trimLeft(std::string_view s) {
    auto it = std::find_if(s.begin(), s.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(it, s.end());
}

std::string trimRight(std::string_view s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(s.begin(), it.base());
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> result;
    std::string current;

    for (char c : s) {
        if (c == delimiter) {
            if (!current.empty()) {
                result.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        result.push_back(std::move(current));
    }

    return result;
}

std::string join(const std::vector<std::string>& parts, std::string_view delimiter) {
    if (parts.empty()) {
        return "";
    }

    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter;
        result += parts[i];
    }
    return result;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    if (prefix.length() > s.length()) {
        return false;
    }
    return s.substr(0, prefix.length()) == prefix;
}

bool parseInt(std::string_view s, int& out) {
    int value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseInt64(std::string_view s, int64_t& out) {
    int64_t value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseDouble(std::string_view s, double& out) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    std::string str(s);
    double value = std::strtod(str.c_str(), &end);
    if (end != str.c_str() + str.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

std::string formatLength(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    std::string s = ss.str();
    while (!s.empty() && s.back() == '0') {
        s.pop_back();
    }
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

}  // namespace str
}  // namespace rc

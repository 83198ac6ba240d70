#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace rc {
namespace file {

// Read entire file to string
Result<std::string> readText(const Path& path);

// Write string to file
[[nodiscard]] bool writeText(const Path& path, std::string_view content);

// File operations
bool exists(const Path& path);
bool isFile(const Path& path);
[[nodiscard]] bool createDirectories(const Path& path);
[[nodiscard]] bool remove(const Path& path);

// Get filename without extension
std::string getStem(const Path& path);

// Get file extension (lowercase, without dot)
std::string getExtension(const Path& path);

} // namespace file
} // namespace rc

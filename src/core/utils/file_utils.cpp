#include "file_utils.h"

#include <fstream>

#include "log.h"
#include "string_utils.h"

namespace rc {

namespace {

// Helper for filesystem operations that return bool and log on failure.
// The callable receives a std::error_code& and performs the fs operation.
template <typename F> bool fsOp(const char* opName, const Path& path, F&& fn) {
    std::error_code ec;
    fn(ec);
    if (ec) {
        log::errorf("FileIO", "Failed to %s: %s (%s)", opName, path.string().c_str(),
                    ec.message().c_str());
        return false;
    }
    return true;
}

} // anonymous namespace

namespace file {

Result<std::string> readText(const Path& path) {
    std::ifstream file(path, std::ios::in);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for reading: %s", path.string().c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

bool writeText(const Path& path, std::string_view content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        log::errorf("FileIO", "Failed to open for writing: %s", path.string().c_str());
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool exists(const Path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool isFile(const Path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool createDirectories(const Path& path) {
    if (path.empty()) {
        return true;
    }
    return fsOp("create directories", path,
                [&](std::error_code& ec) { fs::create_directories(path, ec); });
}

bool remove(const Path& path) {
    return fsOp("remove", path, [&](std::error_code& ec) { fs::remove(path, ec); });
}

std::string getStem(const Path& path) {
    return path.stem().string();
}

std::string getExtension(const Path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return str::toLower(ext);
}

} // namespace file
} // namespace rc

#pragma once

#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

namespace rc {
namespace log {

// Lines read "[time] [LEVEL] [Module] message"; Module names the engine
// stage, e.g. "Assembler", "Orchestrator" or "JobFile".
enum class Level { Debug, Info, Warning, Error };

// Messages below this level are dropped. Info unless [logging] level says otherwise.
void setLevel(Level level);
Level getLevel();

// Map a config integer (0-3) to a level, clamping out-of-range values
Level levelFromInt(int level);

// Unformatted messages
void debug(std::string_view module, std::string_view message);
void info(std::string_view module, std::string_view message);
void warning(std::string_view module, std::string_view message);
void error(std::string_view module, std::string_view message);

namespace detail {

void logAtLevel(Level level, std::string_view module, std::string_view message);

inline constexpr std::size_t kFormatBufSize = 1024;
inline constexpr const char kTruncationSuffix[] = "...[truncated]";

template <typename... Args>
void formatAndLog(Level level, const char* module, const char* format, Args... args) {
    char buffer[kFormatBufSize];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    int written = std::snprintf(buffer, kFormatBufSize, format, args...);
#pragma GCC diagnostic pop

    // Long messages, e.g. a job id list, end in the truncation marker
    if (written >= static_cast<int>(kFormatBufSize)) {
        constexpr std::size_t suffixLen = sizeof(kTruncationSuffix) - 1; // exclude '\0'
        static_assert(suffixLen < kFormatBufSize, "truncation suffix must fit in buffer");
        std::memcpy(buffer + kFormatBufSize - 1 - suffixLen, kTruncationSuffix, suffixLen);
        buffer[kFormatBufSize - 1] = '\0';
    }

    logAtLevel(level, module, buffer);
}

} // namespace detail

// printf-style variants; arguments are not formatted below the current level
template <typename... Args> void debugf(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Debug) {
        detail::formatAndLog(Level::Debug, module, format, args...);
    }
}

template <typename... Args> void infof(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Info) {
        detail::formatAndLog(Level::Info, module, format, args...);
    }
}

template <typename... Args> void warningf(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Warning) {
        detail::formatAndLog(Level::Warning, module, format, args...);
    }
}

template <typename... Args> void errorf(const char* module, const char* format, Args... args) {
    detail::formatAndLog(Level::Error, module, format, args...);
}

// Mirror every line to a file, as set by [logging] file
void setLogFile(const std::string& path);
void closeLogFile();

} // namespace log
} // namespace rc

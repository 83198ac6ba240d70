#pragma once

#include <string>

#include "../threading/thread_pool.h"
#include "../types.h"

namespace rc {

// Optimizer and batch settings, stored as an INI file:
//
//   [optimizer]
//   max_combinations=20000
//   max_stock_variants=1024  ; stock availability variants compared per job
//   default_kerf=0
//   [batch]
//   parallelism=0        ; 0=Auto 1=Fixed 2=Expert
//   threads=0            ; explicit worker count, 0 = use parallelism
//   [logging]
//   level=1              ; 0=Debug 1=Info 2=Warning 3=Error
//   file=
//
// Unknown keys are ignored; malformed values keep their defaults.
class Config {
  public:
    Config() = default;

    // Load/save configuration. A missing file on load is not an error.
    bool load(const Path& path);
    bool save(const Path& path) const;

    // Parse INI text directly (load() reads the file and calls this)
    void loadFromString(const std::string& content);
    std::string toString() const;

    // Optimizer
    usize getMaxCombinations() const { return m_maxCombinations; }
    void setMaxCombinations(usize n) { m_maxCombinations = n > 0 ? n : 1; }

    usize getMaxStockVariants() const { return m_maxStockVariants; }
    void setMaxStockVariants(usize n) { m_maxStockVariants = n > 0 ? n : 1; }

    f64 getDefaultKerf() const { return m_defaultKerf; }
    void setDefaultKerf(f64 kerf) { m_defaultKerf = kerf; }

    // Batch
    ParallelismTier getParallelismTier() const { return m_parallelismTier; }
    void setParallelismTier(ParallelismTier tier) { m_parallelismTier = tier; }

    int getThreads() const { return m_threads; }
    void setThreads(int threads) { m_threads = threads < 0 ? 0 : threads; }

    // Explicit thread count if set, otherwise derived from the parallelism tier
    usize resolveThreadCount() const;

    // Log level (maps to log::Level enum)
    int getLogLevel() const { return m_logLevel; }
    void setLogLevel(int level) { m_logLevel = level; }

    const Path& getLogFilePath() const { return m_logFilePath; }
    void setLogFilePath(const Path& p) { m_logFilePath = p; }

  private:
    usize m_maxCombinations = 20000;
    usize m_maxStockVariants = 1024;
    f64 m_defaultKerf = 0.0;
    ParallelismTier m_parallelismTier = ParallelismTier::Auto;
    int m_threads = 0;
    int m_logLevel = 1;
    Path m_logFilePath;
};

} // namespace rc

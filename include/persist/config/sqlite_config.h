#pragma once

#include <persist/config/retry_config.h>
#include <persist/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace persist::config {

enum class JournalMode { Delete, Truncate, Persist, Memory, WAL, Off };

enum class SynchronousMode { Off, Normal, Full, Extra };

const char* toString(JournalMode mode);
const char* toString(SynchronousMode mode);
Result<JournalMode> parseJournalMode(const std::string& text);
Result<SynchronousMode> parseSynchronousMode(const std::string& text);

/**
 * @brief SQLite connection and tuning settings
 */
struct SqliteConfiguration {
    std::string dbFile;
    int cacheSize = -2000; ///< Negative values are KiB, positive values pages
    int pageSize = 4096;
    JournalMode journalMode = JournalMode::WAL;
    SynchronousMode synchronous = SynchronousMode::Normal;
    std::chrono::milliseconds busyTimeout{5000};
    bool enableForeignKeys = true;
    std::chrono::seconds commandTimeout{30};
    size_t maxConnections = 8;
    RetryConfiguration retry;

    [[nodiscard]] Result<void> validate() const;

    /// PRAGMAs that persist in the database file (applied once at initialization)
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> databasePragmas() const;

    /// PRAGMAs that must be applied to every new connection
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> connectionPragmas() const;
};

/**
 * @brief Load configuration from a JSON file
 *
 * Reads the "SqliteConfiguration" object, or the document root when that key is absent.
 * A missing file yields defaults. Keys present in the file override the defaults one field
 * at a time, including the nested "Retry" object. The result is validated.
 */
Result<SqliteConfiguration> loadSqliteConfiguration(const std::filesystem::path& path);

/**
 * @brief Parse configuration from JSON text (same rules as loadSqliteConfiguration)
 */
Result<SqliteConfiguration> parseSqliteConfiguration(const std::string& jsonText);

/**
 * @brief Serialize to the JSON shape accepted by parseSqliteConfiguration
 */
std::string toJson(const SqliteConfiguration& config);

} // namespace persist::config

#include <persist/config/config_helpers.h>
#include <persist/config/sqlite_config.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace persist::config {

Result<void> RetryConfiguration::validate() const {
    if (maxAttempts < 0) {
        return Error{ErrorCode::ValidationError, "Retry maxAttempts must be >= 0"};
    }
    if (initialDelay.count() < 0) {
        return Error{ErrorCode::ValidationError, "Retry initialDelay must be >= 0"};
    }
    if (maxDelay < initialDelay) {
        return Error{ErrorCode::ValidationError, "Retry maxDelay must be >= initialDelay"};
    }
    if (backoffMultiplier < 1.0) {
        return Error{ErrorCode::ValidationError, "Retry backoffMultiplier must be >= 1.0"};
    }
    return {};
}

const char* toString(JournalMode mode) {
    switch (mode) {
        case JournalMode::Delete: return "DELETE";
        case JournalMode::Truncate: return "TRUNCATE";
        case JournalMode::Persist: return "PERSIST";
        case JournalMode::Memory: return "MEMORY";
        case JournalMode::WAL: return "WAL";
        case JournalMode::Off: return "OFF";
    }
    return "WAL";
}

const char* toString(SynchronousMode mode) {
    switch (mode) {
        case SynchronousMode::Off: return "OFF";
        case SynchronousMode::Normal: return "NORMAL";
        case SynchronousMode::Full: return "FULL";
        case SynchronousMode::Extra: return "EXTRA";
    }
    return "NORMAL";
}

Result<JournalMode> parseJournalMode(const std::string& text) {
    const auto key = normalize_key(text);
    for (auto mode : {JournalMode::Delete, JournalMode::Truncate, JournalMode::Persist,
                      JournalMode::Memory, JournalMode::WAL, JournalMode::Off}) {
        if (key == toString(mode))
            return mode;
    }
    return Error{ErrorCode::ValidationError, "Unknown journal mode: " + text};
}

Result<SynchronousMode> parseSynchronousMode(const std::string& text) {
    const auto key = normalize_key(text);
    for (auto mode : {SynchronousMode::Off, SynchronousMode::Normal, SynchronousMode::Full,
                      SynchronousMode::Extra}) {
        if (key == toString(mode))
            return mode;
    }
    return Error{ErrorCode::ValidationError, "Unknown synchronous mode: " + text};
}

Result<void> SqliteConfiguration::validate() const {
    if (pageSize < 512 || pageSize > 65536 || (pageSize & (pageSize - 1)) != 0) {
        return Error{ErrorCode::ValidationError,
                     "PageSize must be a power of two between 512 and 65536"};
    }
    if (busyTimeout.count() < 0) {
        return Error{ErrorCode::ValidationError, "BusyTimeout must be >= 0"};
    }
    if (commandTimeout.count() < 0) {
        return Error{ErrorCode::ValidationError, "CommandTimeout must be >= 0"};
    }
    if (maxConnections == 0) {
        return Error{ErrorCode::ValidationError, "MaxConnections must be > 0"};
    }
    return retry.validate();
}

std::vector<std::pair<std::string, std::string>> SqliteConfiguration::databasePragmas() const {
    return {{"page_size", std::to_string(pageSize)}, {"journal_mode", toString(journalMode)}};
}

std::vector<std::pair<std::string, std::string>> SqliteConfiguration::connectionPragmas() const {
    return {{"cache_size", std::to_string(cacheSize)},
            {"synchronous", toString(synchronous)},
            {"busy_timeout", std::to_string(busyTimeout.count())},
            {"foreign_keys", enableForeignKeys ? "ON" : "OFF"}};
}

namespace {

template <typename T> void readField(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

void readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = std::chrono::milliseconds(j.at(key).get<int64_t>());
    }
}

Result<SqliteConfiguration> fromJson(const nlohmann::json& doc) {
    const nlohmann::json& j = doc.contains("SqliteConfiguration") ? doc.at("SqliteConfiguration")
                                                                    : doc;
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "SqliteConfiguration must be a JSON object"};
    }

    SqliteConfiguration config;
    try {
        readField(j, "DbFile", config.dbFile);
        readField(j, "CacheSize", config.cacheSize);
        readField(j, "PageSize", config.pageSize);
        readMillis(j, "BusyTimeout", config.busyTimeout);
        readField(j, "EnableForeignKeys", config.enableForeignKeys);
        readField(j, "MaxConnections", config.maxConnections);
        if (j.contains("CommandTimeout")) {
            config.commandTimeout = std::chrono::seconds(j.at("CommandTimeout").get<int64_t>());
        }
        if (j.contains("JournalMode")) {
            auto mode = parseJournalMode(j.at("JournalMode").get<std::string>());
            if (!mode)
                return mode.error();
            config.journalMode = mode.value();
        }
        if (j.contains("SynchronousMode")) {
            auto mode = parseSynchronousMode(j.at("SynchronousMode").get<std::string>());
            if (!mode)
                return mode.error();
            config.synchronous = mode.value();
        }
        if (j.contains("Retry")) {
            const auto& r = j.at("Retry");
            readField(r, "Enabled", config.retry.enabled);
            readField(r, "MaxAttempts", config.retry.maxAttempts);
            readMillis(r, "InitialDelayMs", config.retry.initialDelay);
            readMillis(r, "MaxDelayMs", config.retry.maxDelay);
            readField(r, "BackoffMultiplier", config.retry.backoffMultiplier);
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::ValidationError,
                     std::string("Invalid SqliteConfiguration value: ") + e.what()};
    }

    if (!config.dbFile.empty()) {
        config.dbFile = expand_tilde(config.dbFile).string();
    }

    auto valid = config.validate();
    if (!valid)
        return valid.error();
    return config;
}

} // namespace

Result<SqliteConfiguration> parseSqliteConfiguration(const std::string& jsonText) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::SerializationError,
                     std::string("Failed to parse configuration JSON: ") + e.what()};
    }
    return fromJson(doc);
}

Result<SqliteConfiguration> loadSqliteConfiguration(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] {} not found, using defaults", path.string());
        SqliteConfiguration defaults;
        return defaults;
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::InvalidArgument, "Cannot open configuration file " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto result = parseSqliteConfiguration(buffer.str());
    if (!result) {
        spdlog::warn("[Config] {}: {}", path.string(), result.error().message);
    }
    return result;
}

std::string toJson(const SqliteConfiguration& config) {
    nlohmann::json j;
    j["DbFile"] = config.dbFile;
    j["CacheSize"] = config.cacheSize;
    j["PageSize"] = config.pageSize;
    j["JournalMode"] = toString(config.journalMode);
    j["SynchronousMode"] = toString(config.synchronous);
    j["BusyTimeout"] = config.busyTimeout.count();
    j["EnableForeignKeys"] = config.enableForeignKeys;
    j["CommandTimeout"] = config.commandTimeout.count();
    j["MaxConnections"] = config.maxConnections;
    j["Retry"] = {{"Enabled", config.retry.enabled},
                  {"MaxAttempts", config.retry.maxAttempts},
                  {"InitialDelayMs", config.retry.initialDelay.count()},
                  {"MaxDelayMs", config.retry.maxDelay.count()},
                  {"BackoffMultiplier", config.retry.backoffMultiplier}};

    nlohmann::json doc;
    doc["SqliteConfiguration"] = std::move(j);
    return doc.dump(2);
}

} // namespace persist::config

#pragma once

#include <persist/mapping/entity_mapping.h>
#include <persist/query/expression_translator.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace persist::command {

enum class CommandKind { Insert, Update, Delete, SoftDelete, Revive, Select, Count };

const char* toString(CommandKind kind);

[[nodiscard]] inline bool isWrite(CommandKind kind) {
    return kind != CommandKind::Select && kind != CommandKind::Count;
}

/**
 * @brief One parameterized command, built per call and consumed once
 *
 * Move-only. Executing a context moves it into a WriteCommand or a read, so
 * the same context can never be run twice.
 */
class CommandContext {
public:
    CommandContext(CommandKind kind, std::string sql, query::Parameters parameters,
                   mapping::KeyValues key = {}, std::optional<int64_t> expectedVersion = {},
                   std::chrono::milliseconds timeout = std::chrono::seconds(30))
        : kind_(kind),
          sql_(std::move(sql)),
          parameters_(std::move(parameters)),
          key_(std::move(key)),
          expectedVersion_(expectedVersion),
          timeout_(timeout) {}

    CommandContext(CommandContext&&) noexcept = default;
    CommandContext& operator=(CommandContext&&) noexcept = default;
    CommandContext(const CommandContext&) = delete;
    CommandContext& operator=(const CommandContext&) = delete;

    [[nodiscard]] CommandKind kind() const { return kind_; }
    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] const query::Parameters& parameters() const { return parameters_; }
    [[nodiscard]] const mapping::KeyValues& key() const { return key_; }
    [[nodiscard]] std::string entityKey() const { return mapping::formatKey(key_); }
    [[nodiscard]] const std::optional<int64_t>& expectedVersion() const {
        return expectedVersion_;
    }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
    CommandKind kind_;
    std::string sql_;
    query::Parameters parameters_;
    mapping::KeyValues key_;
    std::optional<int64_t> expectedVersion_;
    std::chrono::milliseconds timeout_;
};

} // namespace persist::command

#pragma once

#include <persist/command/command_context.h>
#include <persist/mapping/entity_mapping.h>
#include <persist/mapping/schema_generator.h>
#include <persist/query/expression_translator.h>

#include <fmt/format.h>

#include <chrono>
#include <memory>

namespace persist::command {

/**
 * @brief Builds commands for T from the cached templates and translator output
 *
 * Update and delete commands filter by primary key first and carry the expected
 * version; every write stamps LastWriteTime with the current time.
 */
template <typename T> class CommandBuilder {
public:
    explicit CommandBuilder(std::shared_ptr<const mapping::EntityMapping<T>> mapping,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30))
        : mapping_(std::move(mapping)),
          templates_(mapping::generateDmlTemplates(mapping_->descriptor())),
          timeout_(timeout) {}

    [[nodiscard]] const mapping::DmlTemplates& templates() const { return templates_; }
    [[nodiscard]] const mapping::EntityMapping<T>& mapping() const { return *mapping_; }

    /**
     * @brief INSERT with lifecycle columns stamped
     *
     * Version is 1, CreatedTime and LastWriteTime are now, IsDeleted is 0, and an
     * unset AbsoluteExpiration becomes now + expiry span when the type has one.
     */
    CommandContext forInsert(const T& entity,
                             TimePoint now = std::chrono::system_clock::now()) const {
        query::Parameters params;
        const auto& columns = descriptor().columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i].isKey() && columns[i].autoIncrement)
                continue;
            params.emplace_back(mapping::parameterName(columns[i]), createValue(entity, i, now));
        }
        return CommandContext(CommandKind::Insert, templates_.insert, std::move(params),
                              mapping_->key(entity), std::nullopt, timeout_);
    }

    Result<CommandContext> forUpdate(const T& entity, int64_t expectedVersion) const {
        if (!descriptor().hasVersion()) {
            return makeMappingError(fmt::format("'{}' has no version column; updates need one",
                                                descriptor().entityName()));
        }
        query::Parameters params;
        const auto& columns = descriptor().columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& col = columns[i];
            if (col.role == mapping::ColumnRole::Version ||
                col.role == mapping::ColumnRole::CreatedTime ||
                col.role == mapping::ColumnRole::SoftDelete)
                continue;
            params.emplace_back(mapping::parameterName(col), valueFor(entity, i));
        }
        params.emplace_back(mapping::kExpectedVersionParam, expectedVersion);
        return CommandContext(CommandKind::Update, templates_.update, std::move(params),
                              mapping_->key(entity), expectedVersion, timeout_);
    }

    /// Soft-delete-capable types get an UPDATE of the delete flag instead of a DELETE
    Result<CommandContext> forDelete(const mapping::KeyValues& key, int64_t expectedVersion) const {
        if (!descriptor().hasVersion()) {
            return makeMappingError(fmt::format("'{}' has no version column; deletes need one",
                                                descriptor().entityName()));
        }
        auto params = keyParameters(key);
        if (!params)
            return params.error();
        auto bound = std::move(params).value();
        bound.emplace_back(mapping::kExpectedVersionParam, expectedVersion);

        if (descriptor().supportsSoftDelete()) {
            if (const auto* lw = descriptor().roleColumn(mapping::ColumnRole::LastWriteTime))
                bound.emplace_back(mapping::parameterName(*lw), now());
            return CommandContext(CommandKind::SoftDelete, templates_.softDelete,
                                  std::move(bound), key, expectedVersion, timeout_);
        }
        return CommandContext(CommandKind::Delete, templates_.deleteByKey, std::move(bound), key,
                              expectedVersion, timeout_);
    }

    /// Rewrites a soft-deleted row with entity's values, stamped as for an insert
    Result<CommandContext> forRevive(const T& entity,
                                     TimePoint now = std::chrono::system_clock::now()) const {
        if (!descriptor().supportsSoftDelete()) {
            return Error{ErrorCode::InvalidState,
                         descriptor().entityName() + " does not support soft delete"};
        }
        query::Parameters params;
        const auto& columns = descriptor().columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& col = columns[i];
            if (col.role == mapping::ColumnRole::Version ||
                col.role == mapping::ColumnRole::SoftDelete)
                continue;
            params.emplace_back(mapping::parameterName(col), createValue(entity, i, now));
        }
        return CommandContext(CommandKind::Revive, templates_.revive, std::move(params),
                              mapping_->key(entity), std::nullopt, timeout_);
    }

    Result<CommandContext> forSelectByKey(const mapping::KeyValues& key) const {
        auto params = keyParameters(key);
        if (!params)
            return params.error();
        return CommandContext(CommandKind::Select, templates_.selectByKey,
                              std::move(params).value(), key, std::nullopt, timeout_);
    }

    Result<CommandContext> forSelect(const query::Predicate& predicate,
                                     const query::SelectOptions& options) const {
        query::ExpressionTranslator translator(descriptor());
        auto translated = translator.translateSelect(predicate, options);
        if (!translated)
            return translated.error();
        return CommandContext(CommandKind::Select, std::move(translated.value().sql),
                              std::move(translated.value().parameters), {}, std::nullopt,
                              timeout_);
    }

    Result<CommandContext> forCount(const query::Predicate& predicate,
                                    const query::SelectOptions& options) const {
        query::ExpressionTranslator translator(descriptor());
        auto translated = translator.translateCount(predicate, options);
        if (!translated)
            return translated.error();
        return CommandContext(CommandKind::Count, std::move(translated.value().sql),
                              std::move(translated.value().parameters), {}, std::nullopt,
                              timeout_);
    }

    /// Version and delete flag of the row with key; used to classify zero-row writes
    Result<CommandContext> forVersionCheck(const mapping::KeyValues& key) const {
        auto params = keyParameters(key);
        if (!params)
            return params.error();
        return CommandContext(CommandKind::Select, templates_.versionByKey,
                              std::move(params).value(), key, std::nullopt, timeout_);
    }

    Result<query::Parameters> keyParameters(const mapping::KeyValues& key) const {
        const auto& indices = descriptor().keyIndices();
        if (key.size() != indices.size()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("'{}' key has {} columns, got {} values",
                                     descriptor().entityName(), indices.size(), key.size())};
        }
        query::Parameters params;
        for (size_t i = 0; i < indices.size(); ++i)
            params.emplace_back(mapping::parameterName(descriptor().columns()[indices[i]]), key[i]);
        return params;
    }

private:
    const mapping::MappingDescriptor& descriptor() const { return mapping_->descriptor(); }

    static Value now() { return formatTimestamp(std::chrono::system_clock::now()); }

    Value valueFor(const T& entity, size_t column) const {
        if (descriptor().columns()[column].role == mapping::ColumnRole::LastWriteTime)
            return now();
        return mapping_->read(entity, column);
    }

    Value createValue(const T& entity, size_t column, TimePoint now) const {
        const auto& col = descriptor().columns()[column];
        switch (col.role) {
            case mapping::ColumnRole::Version: return int64_t{1};
            case mapping::ColumnRole::CreatedTime:
            case mapping::ColumnRole::LastWriteTime: return formatTimestamp(now);
            case mapping::ColumnRole::SoftDelete: return int64_t{0};
            case mapping::ColumnRole::Expiration: {
                auto current = mapping_->read(entity, column);
                const auto& span = descriptor().expirySpan();
                if (!isNull(current) || !span)
                    return current;
                return formatTimestamp(now + *span);
            }
            case mapping::ColumnRole::None: break;
        }
        return mapping_->read(entity, column);
    }

    std::shared_ptr<const mapping::EntityMapping<T>> mapping_;
    mapping::DmlTemplates templates_;
    std::chrono::milliseconds timeout_;
};

} // namespace persist::command

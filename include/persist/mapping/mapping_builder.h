#pragma once

#include <persist/mapping/descriptor_cache.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace persist::mapping {

namespace detail {

template <typename M> struct ColumnTypeOf;
template <> struct ColumnTypeOf<int> {
    static constexpr ColumnType value = ColumnType::Integer;
};
template <> struct ColumnTypeOf<int64_t> {
    static constexpr ColumnType value = ColumnType::Integer;
};
template <> struct ColumnTypeOf<bool> {
    static constexpr ColumnType value = ColumnType::Boolean;
};
template <> struct ColumnTypeOf<double> {
    static constexpr ColumnType value = ColumnType::Real;
};
template <> struct ColumnTypeOf<std::string> {
    static constexpr ColumnType value = ColumnType::Text;
};
template <> struct ColumnTypeOf<TimePoint> {
    static constexpr ColumnType value = ColumnType::DateTime;
};
template <> struct ColumnTypeOf<ByteVector> {
    static constexpr ColumnType value = ColumnType::Blob;
};
template <typename M> struct ColumnTypeOf<std::optional<M>> : ColumnTypeOf<M> {};

struct ResolvedTarget {
    std::string table;
    std::vector<std::string> columns;
};

// Shared by typed and by-name foreign keys once the target descriptor is known
Result<ResolvedTarget> resolveTargetColumns(const MappingDescriptor& target,
                                            const std::vector<std::string>& targetFields);

// Validates columns, keys, roles and indexes; shared by all MappingBuilder<T>
Result<std::vector<size_t>> validateParts(MappingDescriptor::Parts& parts);

} // namespace detail

inline IndexColumn ascending(std::string fieldName) {
    return {std::move(fieldName), false};
}

inline IndexColumn descending(std::string fieldName) {
    return {std::move(fieldName), true};
}

/**
 * @brief Collects the declarative mapping of T and validates it in build()
 *
 * Columns are registered through member pointers so reads and writes stay typed.
 * Everything is validated at build(): a missing primary key, duplicate column
 * names, contradictory roles or an unresolvable foreign-key target fail with
 * ErrorCode::MappingError.
 */
template <typename T> class MappingBuilder {
public:
    class ColumnOptions {
    public:
        ColumnOptions& name(std::string columnName) {
            desc_.columnName = std::move(columnName);
            return *this;
        }
        ColumnOptions& type(ColumnType columnType) {
            desc_.type = columnType;
            return *this;
        }
        ColumnOptions& nullable(bool value = true) {
            desc_.nullable = value;
            return *this;
        }
        ColumnOptions& size(int value) {
            desc_.size = value;
            return *this;
        }
        ColumnOptions& precision(int value, int scale = 0) {
            desc_.precision = value;
            desc_.scale = scale;
            return *this;
        }
        ColumnOptions& defaultValue(std::string sql) {
            desc_.defaultValue = std::move(sql);
            return *this;
        }
        ColumnOptions& unique(bool value = true) {
            desc_.unique = value;
            return *this;
        }
        ColumnOptions& autoIncrement(bool value = true) {
            desc_.autoIncrement = value;
            return *this;
        }
        /// Explicit position inside a composite key
        ColumnOptions& keyOrder(int order) {
            desc_.keyOrder = order;
            explicitKeyOrder_ = true;
            return *this;
        }

    private:
        friend class MappingBuilder;
        ColumnDescriptor desc_;
        FieldAccessor<T> accessor_;
        bool explicitKeyOrder_ = false;
    };

    class IndexOptions {
    public:
        IndexOptions& unique(bool value = true) {
            desc_.unique = value;
            return *this;
        }
        IndexOptions& where(std::string predicate) {
            desc_.where = std::move(predicate);
            return *this;
        }

    private:
        friend class MappingBuilder;
        IndexDescriptor desc_;
    };

    class ForeignKeyOptions {
    public:
        ForeignKeyOptions& name(std::string constraintName) {
            desc_.name = std::move(constraintName);
            return *this;
        }
        ForeignKeyOptions& onDelete(ForeignKeyAction action) {
            desc_.onDelete = action;
            return *this;
        }
        ForeignKeyOptions& onUpdate(ForeignKeyAction action) {
            desc_.onUpdate = action;
            return *this;
        }

    private:
        friend class MappingBuilder;
        ForeignKeyDescriptor desc_;
        std::vector<std::string> fields_;
        std::vector<std::string> targetFields_;
        std::function<Result<detail::ResolvedTarget>(const MappingDescriptor::Parts&)> resolve_;
    };

    MappingBuilder& table(std::string tableName) {
        table_ = std::move(tableName);
        return *this;
    }

    /// Name used in messages and audit records; defaults to the table name
    MappingBuilder& entityName(std::string name) {
        entityName_ = std::move(name);
        return *this;
    }

    template <typename M> ColumnOptions& column(M T::*member, std::string fieldName) {
        auto& opts = columns_.emplace_back();
        opts.desc_.fieldName = fieldName;
        opts.desc_.columnName = std::move(fieldName);
        opts.desc_.type = detail::ColumnTypeOf<M>::value;
        opts.desc_.nullable = is_optional_v<M>;
        opts.accessor_ = accessorFor(member);
        return opts;
    }

    /// Primary-key column; keys are ordered by declaration unless keyOrder() is given
    template <typename M> ColumnOptions& key(M T::*member, std::string fieldName) {
        auto& opts = column(member, std::move(fieldName));
        opts.desc_.keyOrder = nextKeyOrder_++;
        opts.desc_.nullable = false;
        return opts;
    }

    template <typename M>
    ColumnOptions& version(M T::*member, std::string fieldName = "Version") {
        auto& opts = column(member, std::move(fieldName));
        opts.desc_.role = ColumnRole::Version;
        opts.desc_.defaultValue = "1";
        return opts;
    }

    ColumnOptions& createdTime(TimePoint T::*member, std::string fieldName = "CreatedTime") {
        auto& opts = column(member, std::move(fieldName));
        opts.desc_.role = ColumnRole::CreatedTime;
        return opts;
    }

    ColumnOptions& lastWriteTime(TimePoint T::*member, std::string fieldName = "LastWriteTime") {
        auto& opts = column(member, std::move(fieldName));
        opts.desc_.role = ColumnRole::LastWriteTime;
        return opts;
    }

    /// Soft-delete flag backed by an entity member
    ColumnOptions& softDelete(bool T::*member) {
        auto& opts = column(member, "IsDeleted");
        opts.desc_.role = ColumnRole::SoftDelete;
        opts.desc_.defaultValue = "0";
        return opts;
    }

    /// Soft-delete flag kept only in the table
    ColumnOptions& softDelete() {
        auto& opts = flagColumn("IsDeleted", ColumnType::Boolean, ColumnRole::SoftDelete);
        opts.desc_.defaultValue = "0";
        return opts;
    }

    /**
     * @brief Expiration timestamp; span, when given, is added to CreatedTime on create
     */
    ColumnOptions& expiry(std::optional<TimePoint> T::*member,
                          std::optional<std::chrono::seconds> span = std::nullopt) {
        expirySpan_ = span;
        auto& opts = column(member, "AbsoluteExpiration");
        opts.desc_.role = ColumnRole::Expiration;
        return opts;
    }

    ColumnOptions& expiry(std::optional<std::chrono::seconds> span = std::nullopt) {
        expirySpan_ = span;
        auto& opts = flagColumn("AbsoluteExpiration", ColumnType::DateTime, ColumnRole::Expiration);
        opts.desc_.nullable = true;
        return opts;
    }

    MappingBuilder& auditTrail(bool enabled = true) {
        auditTrail_ = enabled;
        return *this;
    }

    /**
     * @brief Allow named lists of this type, tracked in the EntryListMapping table
     *
     * Needs a version column and a single Integer or Text key.
     */
    MappingBuilder& syncWithList(bool enabled = true) {
        syncWithList_ = enabled;
        return *this;
    }

    /// Drop a previously registered field, e.g. one added by a shared base describe()
    MappingBuilder& notMapped(std::string fieldName) {
        notMapped_.insert(std::move(fieldName));
        return *this;
    }

    IndexOptions& index(std::string name, std::vector<IndexColumn> fields) {
        auto& opts = indexes_.emplace_back();
        opts.desc_.name = std::move(name);
        opts.desc_.columns = std::move(fields);
        return opts;
    }

    MappingBuilder& check(std::string name, std::string expression) {
        checks_.push_back({std::move(name), std::move(expression)});
        return *this;
    }

    /**
     * @brief Foreign key to another mapped type, resolved through the descriptor cache
     *
     * targetFields defaults to the target's primary key.
     */
    template <typename Target>
    ForeignKeyOptions& foreignKey(std::vector<std::string> fields,
                                  std::vector<std::string> targetFields = {}) {
        auto& opts = foreignKeys_.emplace_back();
        opts.fields_ = std::move(fields);
        opts.targetFields_ = std::move(targetFields);
        auto targetFieldsCopy = opts.targetFields_;
        opts.resolve_ = [targetFieldsCopy](const MappingDescriptor::Parts& self)
            -> Result<detail::ResolvedTarget> {
            if constexpr (std::is_same_v<Target, T>) {
                MappingDescriptor own(self);
                return detail::resolveTargetColumns(own, targetFieldsCopy);
            } else {
                auto target = DescriptorCache::instance().get<Target>();
                if (!target) {
                    return makeMappingError("Foreign-key target of table '" + self.tableName +
                                            "' failed to map: " + target.error().message);
                }
                return detail::resolveTargetColumns(target.value()->descriptor(),
                                                    targetFieldsCopy);
            }
        };
        return opts;
    }

    /**
     * @brief Foreign key to a table registered elsewhere; targetFields are its field names
     */
    ForeignKeyOptions& foreignKey(std::string targetTable, std::vector<std::string> fields,
                                  std::vector<std::string> targetFields = {}) {
        auto& opts = foreignKeys_.emplace_back();
        opts.fields_ = std::move(fields);
        opts.targetFields_ = std::move(targetFields);
        auto targetFieldsCopy = opts.targetFields_;
        opts.resolve_ = [targetTable, targetFieldsCopy](const MappingDescriptor::Parts& self)
            -> Result<detail::ResolvedTarget> {
            if (targetTable == self.tableName) {
                MappingDescriptor own(self);
                return detail::resolveTargetColumns(own, targetFieldsCopy);
            }
            auto target = DescriptorCache::instance().findByTable(targetTable);
            if (!target) {
                return makeMappingError("Foreign-key target table '" + targetTable +
                                        "' of '" + self.tableName + "' is not registered");
            }
            return detail::resolveTargetColumns(*target, targetFieldsCopy);
        };
        return opts;
    }

    Result<std::shared_ptr<const EntityMapping<T>>> build() {
        MappingDescriptor::Parts parts;
        parts.tableName = table_;
        parts.entityName = entityName_.empty() ? table_ : entityName_;
        parts.auditTrail = auditTrail_;
        parts.syncWithList = syncWithList_;
        parts.expirySpan = expirySpan_;
        parts.checks = checks_;

        std::vector<FieldAccessor<T>> accessors;
        bool anyExplicitOrder = false;
        for (const auto& opts : columns_) {
            if (notMapped_.count(opts.desc_.fieldName))
                continue;
            anyExplicitOrder = anyExplicitOrder || opts.explicitKeyOrder_;
            parts.columns.push_back(opts.desc_);
            accessors.push_back(opts.accessor_);
        }
        if (anyExplicitOrder) {
            for (size_t i = 0; i < parts.columns.size(); ++i) {
                auto& col = parts.columns[i];
                if (col.isKey() && !columnHasExplicitOrder(col.fieldName)) {
                    return makeMappingError("'" + parts.entityName + "': key field '" +
                                            col.fieldName +
                                            "' needs keyOrder() when another key uses it");
                }
            }
        }
        for (const auto& opts : indexes_)
            parts.indexes.push_back(opts.desc_);

        if (parts.expirySpan && !std::any_of(parts.columns.begin(), parts.columns.end(),
                                             [](const ColumnDescriptor& c) {
                                                 return c.role == ColumnRole::Expiration;
                                             })) {
            parts.expirySpan.reset();
        }

        auto keyIndices = detail::validateParts(parts);
        if (!keyIndices)
            return keyIndices.error();
        if (parts.syncWithList) {
            const auto& keys = keyIndices.value();
            const bool versioned = std::any_of(
                parts.columns.begin(), parts.columns.end(),
                [](const ColumnDescriptor& c) { return c.role == ColumnRole::Version; });
            if (!versioned || keys.size() != 1 ||
                (parts.columns[keys.front()].type != ColumnType::Integer &&
                 parts.columns[keys.front()].type != ColumnType::Text)) {
                return makeMappingError("'" + parts.entityName +
                                        "': list sync needs a version column and a single "
                                        "Integer or Text key");
            }
        }

        for (const auto& opts : foreignKeys_) {
            auto fk = opts.desc_;
            for (const auto& field : opts.fields_) {
                auto it = std::find_if(
                    parts.columns.begin(), parts.columns.end(),
                    [&](const ColumnDescriptor& c) { return c.fieldName == field; });
                if (it == parts.columns.end()) {
                    return makeMappingError("'" + parts.entityName + "': foreign-key field '" +
                                            field + "' is not mapped");
                }
                fk.columns.push_back(it->columnName);
            }
            auto target = opts.resolve_(parts);
            if (!target)
                return target.error();
            if (target.value().columns.size() != fk.columns.size()) {
                return makeMappingError("'" + parts.entityName + "': foreign key to '" +
                                        target.value().table + "' has " +
                                        std::to_string(fk.columns.size()) +
                                        " columns but references " +
                                        std::to_string(target.value().columns.size()));
            }
            fk.referencedTable = target.value().table;
            fk.referencedColumns = target.value().columns;
            if (fk.name.empty()) {
                fk.name = "FK_" + parts.tableName + "_" + fk.referencedTable;
            }
            parts.foreignKeys.push_back(std::move(fk));
        }

        auto descriptor = std::make_shared<const MappingDescriptor>(std::move(parts));
        return std::make_shared<const EntityMapping<T>>(std::move(descriptor),
                                                        std::move(accessors));
    }

private:
    template <typename M> static FieldAccessor<T> accessorFor(M T::*member) {
        return {[member](const T& entity) -> Value {
                    return ValueTraits<M>::toValue(entity.*member);
                },
                [member](T& entity, const Value& value) -> Result<void> {
                    auto converted = ValueTraits<M>::fromValue(value);
                    if (!converted)
                        return converted.error();
                    entity.*member = std::move(converted).value();
                    return {};
                }};
    }

    ColumnOptions& flagColumn(std::string fieldName, ColumnType type, ColumnRole role) {
        auto& opts = columns_.emplace_back();
        opts.desc_.fieldName = fieldName;
        opts.desc_.columnName = std::move(fieldName);
        opts.desc_.type = type;
        opts.desc_.role = role;
        opts.desc_.backed = false;
        return opts;
    }

    bool columnHasExplicitOrder(const std::string& fieldName) const {
        for (const auto& opts : columns_) {
            if (opts.desc_.fieldName == fieldName && opts.explicitKeyOrder_)
                return true;
        }
        return false;
    }

    std::string table_;
    std::string entityName_;
    std::deque<ColumnOptions> columns_;
    std::deque<IndexOptions> indexes_;
    std::deque<ForeignKeyOptions> foreignKeys_;
    std::vector<CheckConstraint> checks_;
    std::set<std::string> notMapped_;
    bool auditTrail_ = false;
    bool syncWithList_ = false;
    std::optional<std::chrono::seconds> expirySpan_;
    int nextKeyOrder_ = 0;
};

} // namespace persist::mapping

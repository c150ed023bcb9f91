#include <persist/mapping/mapping_builder.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <set>

namespace persist::mapping {

const char* toString(ColumnType type) {
    switch (type) {
        case ColumnType::Integer: return "Integer";
        case ColumnType::Real: return "Real";
        case ColumnType::Text: return "Text";
        case ColumnType::Blob: return "Blob";
        case ColumnType::Numeric: return "Numeric";
        case ColumnType::Boolean: return "Boolean";
        case ColumnType::DateTime: return "DateTime";
    }
    return "Text";
}

const char* toString(ForeignKeyAction action) {
    switch (action) {
        case ForeignKeyAction::NoAction: return "NO ACTION";
        case ForeignKeyAction::Cascade: return "CASCADE";
        case ForeignKeyAction::SetNull: return "SET NULL";
        case ForeignKeyAction::SetDefault: return "SET DEFAULT";
        case ForeignKeyAction::Restrict: return "RESTRICT";
    }
    return "NO ACTION";
}

std::string formatKey(const KeyValues& key) {
    std::string out;
    for (size_t i = 0; i < key.size(); ++i) {
        if (i > 0)
            out += '|';
        out += toDisplayString(key[i]);
    }
    return out;
}

Result<KeyValues> parseKey(const MappingDescriptor& descriptor, const std::string& text) {
    const auto& keys = descriptor.keyIndices();
    if (keys.size() != 1) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("'{}' has a {}-column key; only single keys parse",
                                 descriptor.entityName(), keys.size())};
    }
    const auto& column = descriptor.columns()[keys.front()];
    switch (column.type) {
        case ColumnType::Text:
            return KeyValues{Value{text}};
        case ColumnType::Integer: {
            int64_t id = 0;
            const auto* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(text.data(), end, id);
            if (ec != std::errc{} || ptr != end) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("'{}' is not an integer key of '{}'", text,
                                         descriptor.entityName())};
            }
            return KeyValues{Value{id}};
        }
        default:
            return Error{ErrorCode::NotSupported,
                         fmt::format("'{}' key column {} is {}; cannot parse",
                                     descriptor.entityName(), column.columnName,
                                     toString(column.type))};
    }
}

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<size_t> orderedKeyIndices(const std::vector<ColumnDescriptor>& columns) {
    std::vector<size_t> keys;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].isKey())
            keys.push_back(i);
    }
    std::stable_sort(keys.begin(), keys.end(), [&](size_t a, size_t b) {
        return columns[a].keyOrder < columns[b].keyOrder;
    });
    return keys;
}

} // namespace

MappingDescriptor::MappingDescriptor(Parts parts)
    : parts_(std::move(parts)), keyIndices_(orderedKeyIndices(parts_.columns)) {}

const ColumnDescriptor* MappingDescriptor::findByField(const std::string& fieldName) const {
    auto index = indexOfField(fieldName);
    return index ? &parts_.columns[*index] : nullptr;
}

const ColumnDescriptor* MappingDescriptor::findByColumn(const std::string& columnName) const {
    const auto wanted = lower(columnName);
    for (const auto& col : parts_.columns) {
        if (lower(col.columnName) == wanted)
            return &col;
    }
    return nullptr;
}

std::optional<size_t> MappingDescriptor::indexOfField(const std::string& fieldName) const {
    for (size_t i = 0; i < parts_.columns.size(); ++i) {
        if (parts_.columns[i].fieldName == fieldName)
            return i;
    }
    return std::nullopt;
}

const ColumnDescriptor* MappingDescriptor::roleColumn(ColumnRole role) const {
    auto index = roleIndex(role);
    return index ? &parts_.columns[*index] : nullptr;
}

std::optional<size_t> MappingDescriptor::roleIndex(ColumnRole role) const {
    for (size_t i = 0; i < parts_.columns.size(); ++i) {
        if (parts_.columns[i].role == role)
            return i;
    }
    return std::nullopt;
}

bool MappingDescriptor::hasAutoIncrementKey() const {
    return keyIndices_.size() == 1 && parts_.columns[keyIndices_.front()].autoIncrement;
}

namespace detail {

Result<ResolvedTarget> resolveTargetColumns(const MappingDescriptor& target,
                                            const std::vector<std::string>& targetFields) {
    ResolvedTarget resolved;
    resolved.table = target.tableName();
    if (targetFields.empty()) {
        for (size_t index : target.keyIndices())
            resolved.columns.push_back(target.columns()[index].columnName);
        return resolved;
    }
    for (const auto& field : targetFields) {
        const auto* col = target.findByField(field);
        if (!col) {
            return makeMappingError(fmt::format(
                "Foreign-key target field '{}' is not mapped on '{}'", field, target.tableName()));
        }
        resolved.columns.push_back(col->columnName);
    }
    return resolved;
}

Result<std::vector<size_t>> validateParts(MappingDescriptor::Parts& parts) {
    const auto& entity = parts.entityName;
    if (parts.tableName.empty()) {
        return makeMappingError("Mapping has no table name; call table() in describe()");
    }
    if (parts.columns.empty()) {
        return makeMappingError(fmt::format("'{}': no columns mapped", entity));
    }

    std::set<std::string> columnNames;
    std::set<std::string> fieldNames;
    std::map<ColumnRole, std::string> roles;
    for (auto& col : parts.columns) {
        if (col.columnName.empty()) {
            return makeMappingError(
                fmt::format("'{}': field '{}' has an empty column name", entity, col.fieldName));
        }
        if (!columnNames.insert(lower(col.columnName)).second) {
            return makeMappingError(
                fmt::format("'{}': duplicate column name '{}'", entity, col.columnName));
        }
        if (!fieldNames.insert(col.fieldName).second) {
            return makeMappingError(
                fmt::format("'{}': field '{}' registered twice", entity, col.fieldName));
        }
        if (col.role != ColumnRole::None) {
            auto [it, inserted] = roles.emplace(col.role, col.columnName);
            if (!inserted) {
                return makeMappingError(fmt::format(
                    "'{}': columns '{}' and '{}' claim the same role", entity, it->second,
                    col.columnName));
            }
        }
        if (col.role == ColumnRole::Version && col.type != ColumnType::Integer) {
            return makeMappingError(
                fmt::format("'{}': version column '{}' must be an integer", entity,
                            col.columnName));
        }
        if (col.isKey() && col.role != ColumnRole::None) {
            return makeMappingError(fmt::format(
                "'{}': column '{}' cannot be both a key and a tracked column", entity,
                col.columnName));
        }
        if (col.isKey())
            col.nullable = false;
    }

    auto keys = orderedKeyIndices(parts.columns);
    if (keys.empty()) {
        return makeMappingError(fmt::format("'{}': no primary key declared", entity));
    }
    for (size_t i = 1; i < keys.size(); ++i) {
        if (parts.columns[keys[i]].keyOrder == parts.columns[keys[i - 1]].keyOrder) {
            return makeMappingError(fmt::format("'{}': key columns '{}' and '{}' share order {}",
                                                entity, parts.columns[keys[i - 1]].columnName,
                                                parts.columns[keys[i]].columnName,
                                                parts.columns[keys[i]].keyOrder));
        }
    }
    for (const auto& col : parts.columns) {
        if (!col.autoIncrement)
            continue;
        if (!col.isKey() || keys.size() != 1 || col.type != ColumnType::Integer) {
            return makeMappingError(fmt::format(
                "'{}': auto-increment is only valid on a single integer primary key ('{}')",
                entity, col.columnName));
        }
    }

    std::set<std::string> indexNames;
    for (const auto& index : parts.indexes) {
        if (index.name.empty() || index.columns.empty()) {
            return makeMappingError(
                fmt::format("'{}': index needs a name and at least one column", entity));
        }
        if (!indexNames.insert(lower(index.name)).second) {
            return makeMappingError(
                fmt::format("'{}': duplicate index name '{}'", entity, index.name));
        }
        for (const auto& ic : index.columns) {
            if (!fieldNames.count(ic.fieldName)) {
                return makeMappingError(
                    fmt::format("'{}': index '{}' references unmapped field '{}'", entity,
                                index.name, ic.fieldName));
            }
        }
    }
    return keys;
}

} // namespace detail

DescriptorCache& DescriptorCache::instance() {
    static DescriptorCache cache;
    return cache;
}

std::vector<std::type_index>& DescriptorCache::buildingStack() {
    thread_local std::vector<std::type_index> stack;
    return stack;
}

std::shared_ptr<const MappingBase> DescriptorCache::lookup(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = byType_.find(type);
    return it == byType_.end() ? nullptr : it->second;
}

Result<std::shared_ptr<const MappingBase>>
DescriptorCache::insertIfAbsent(std::type_index type, std::shared_ptr<const MappingBase> mapping) {
    std::unique_lock lock(mutex_);
    if (auto existing = byType_.find(type); existing != byType_.end()) {
        return existing->second;
    }

    const auto& descriptor = mapping->sharedDescriptor();
    const auto table = lower(descriptor->tableName());
    if (auto owner = byTable_.find(table); owner != byTable_.end()) {
        spdlog::error("[Mapping] table {} is already mapped by {}; {} rejected",
                      descriptor->tableName(), owner->second->entityName(),
                      descriptor->entityName());
        return makeMappingError("Table '" + descriptor->tableName() + "' is already mapped by '" +
                                owner->second->entityName() + "'");
    }

    byTable_.emplace(table, descriptor);
    spdlog::debug("[Mapping] registered {} -> table {} ({} columns)", descriptor->entityName(),
                  descriptor->tableName(), descriptor->columns().size());
    return byType_.emplace(type, std::move(mapping)).first->second;
}

std::shared_ptr<const MappingDescriptor>
DescriptorCache::findByTable(const std::string& tableName) const {
    std::shared_lock lock(mutex_);
    auto it = byTable_.find(lower(tableName));
    return it == byTable_.end() ? nullptr : it->second;
}

size_t DescriptorCache::size() const {
    std::shared_lock lock(mutex_);
    return byType_.size();
}

} // namespace persist::mapping

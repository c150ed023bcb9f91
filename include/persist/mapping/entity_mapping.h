#pragma once

#include <persist/core/types.h>
#include <persist/core/value.h>
#include <persist/mapping/mapping_descriptor.h>

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace persist::mapping {

/// Primary-key values in key order
using KeyValues = std::vector<Value>;

/**
 * @brief Render key values for messages and audit records ("42", "tenant-a|7")
 */
std::string formatKey(const KeyValues& key);

/**
 * @brief Inverse of formatKey for a single Integer or Text key column
 */
Result<KeyValues> parseKey(const MappingDescriptor& descriptor, const std::string& text);

template <typename T> class MappingBuilder;

/**
 * @brief Registration hook, specialized once per mapped type
 *
 * @code
 * template <> struct EntityTraits<Order> {
 *     static void describe(MappingBuilder<Order>& b) {
 *         b.table("Orders");
 *         b.key(&Order::id, "Id");
 *         b.column(&Order::name, "Name").size(100);
 *         b.version(&Order::version);
 *     }
 * };
 * @endcode
 */
template <typename T> struct EntityTraits;

template <typename T>
concept MappedEntity = std::default_initializable<T> && requires(MappingBuilder<T>& b) {
    EntityTraits<T>::describe(b);
};

/**
 * @brief Type-erased base stored in the descriptor cache
 */
class MappingBase {
public:
    explicit MappingBase(std::shared_ptr<const MappingDescriptor> descriptor)
        : descriptor_(std::move(descriptor)) {}
    virtual ~MappingBase() = default;

    [[nodiscard]] const MappingDescriptor& descriptor() const { return *descriptor_; }
    [[nodiscard]] const std::shared_ptr<const MappingDescriptor>& sharedDescriptor() const {
        return descriptor_;
    }

private:
    std::shared_ptr<const MappingDescriptor> descriptor_;
};

template <typename T> struct FieldAccessor {
    std::function<Value(const T&)> get;
    std::function<Result<void>(T&, const Value&)> set;
};

/**
 * @brief Descriptor plus typed member access for T
 *
 * accessors()[i] belongs to descriptor().columns()[i]. Columns without an entity
 * member (flag-only soft delete / expiry) have empty accessors.
 */
template <typename T> class EntityMapping final : public MappingBase {
public:
    EntityMapping(std::shared_ptr<const MappingDescriptor> descriptor,
                  std::vector<FieldAccessor<T>> accessors)
        : MappingBase(std::move(descriptor)), accessors_(std::move(accessors)) {}

    [[nodiscard]] Value read(const T& entity, size_t column) const {
        const auto& accessor = accessors_.at(column);
        if (accessor.get)
            return accessor.get(entity);
        return unbackedDefault(descriptor().columns()[column]);
    }

    Result<void> write(T& entity, size_t column, const Value& value) const {
        const auto& accessor = accessors_.at(column);
        if (!accessor.set)
            return {};
        auto result = accessor.set(entity, value);
        if (!result) {
            return Error{result.error().code, "Column '" +
                                                  descriptor().columns()[column].columnName +
                                                  "': " + result.error().message};
        }
        return {};
    }

    /// All column values in descriptor order
    [[nodiscard]] std::vector<Value> row(const T& entity) const {
        std::vector<Value> values;
        values.reserve(accessors_.size());
        for (size_t i = 0; i < accessors_.size(); ++i)
            values.push_back(read(entity, i));
        return values;
    }

    /// Build an entity from values in descriptor order (SELECT column order)
    Result<T> fromRow(const std::vector<Value>& values) const {
        if (values.size() != accessors_.size()) {
            return Error{ErrorCode::InternalError,
                         "Row has " + std::to_string(values.size()) + " values, mapping has " +
                             std::to_string(accessors_.size()) + " columns"};
        }
        T entity{};
        for (size_t i = 0; i < values.size(); ++i) {
            auto written = write(entity, i, values[i]);
            if (!written)
                return written.error();
        }
        return entity;
    }

    [[nodiscard]] KeyValues key(const T& entity) const {
        KeyValues values;
        for (size_t index : descriptor().keyIndices())
            values.push_back(read(entity, index));
        return values;
    }

    [[nodiscard]] std::optional<Value> roleValue(const T& entity, ColumnRole role) const {
        auto index = descriptor().roleIndex(role);
        if (!index)
            return std::nullopt;
        return read(entity, *index);
    }

    Result<void> setRole(T& entity, ColumnRole role, const Value& value) const {
        auto index = descriptor().roleIndex(role);
        if (!index)
            return {};
        return write(entity, *index, value);
    }

    /// Version field value; 0 when the type has no version column
    [[nodiscard]] int64_t version(const T& entity) const {
        auto value = roleValue(entity, ColumnRole::Version);
        if (!value)
            return 0;
        if (auto* v = std::get_if<int64_t>(&*value))
            return *v;
        return 0;
    }

    [[nodiscard]] const std::vector<FieldAccessor<T>>& accessors() const { return accessors_; }

private:
    static Value unbackedDefault(const ColumnDescriptor& column) {
        if (column.role == ColumnRole::SoftDelete)
            return int64_t{0};
        return nullptr;
    }

    std::vector<FieldAccessor<T>> accessors_;
};

} // namespace persist::mapping

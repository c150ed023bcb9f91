#pragma once

#include <persist/mapping/column.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace persist::mapping {

/**
 * @brief Immutable description of how one entity type maps onto a table
 *
 * Built once per type by MappingBuilder and shared through DescriptorCache.
 * Column order is the registration order and is also the SELECT column order.
 */
class MappingDescriptor {
public:
    struct Parts {
        std::string entityName;
        std::string tableName;
        std::vector<ColumnDescriptor> columns;
        std::vector<IndexDescriptor> indexes;
        std::vector<ForeignKeyDescriptor> foreignKeys;
        std::vector<CheckConstraint> checks;
        bool auditTrail = false;
        bool syncWithList = false;
        std::optional<std::chrono::seconds> expirySpan;
    };

    explicit MappingDescriptor(Parts parts);

    [[nodiscard]] const std::string& entityName() const { return parts_.entityName; }
    [[nodiscard]] const std::string& tableName() const { return parts_.tableName; }
    [[nodiscard]] const std::vector<ColumnDescriptor>& columns() const { return parts_.columns; }
    [[nodiscard]] const std::vector<IndexDescriptor>& indexes() const { return parts_.indexes; }
    [[nodiscard]] const std::vector<ForeignKeyDescriptor>& foreignKeys() const {
        return parts_.foreignKeys;
    }
    [[nodiscard]] const std::vector<CheckConstraint>& checks() const { return parts_.checks; }

    /// Indices into columns(), in primary-key order
    [[nodiscard]] const std::vector<size_t>& keyIndices() const { return keyIndices_; }

    [[nodiscard]] const ColumnDescriptor* findByField(const std::string& fieldName) const;
    [[nodiscard]] const ColumnDescriptor* findByColumn(const std::string& columnName) const;
    [[nodiscard]] std::optional<size_t> indexOfField(const std::string& fieldName) const;

    /// First column with the role, or nullptr
    [[nodiscard]] const ColumnDescriptor* roleColumn(ColumnRole role) const;
    [[nodiscard]] std::optional<size_t> roleIndex(ColumnRole role) const;

    [[nodiscard]] bool hasVersion() const { return roleColumn(ColumnRole::Version) != nullptr; }
    [[nodiscard]] bool supportsSoftDelete() const {
        return roleColumn(ColumnRole::SoftDelete) != nullptr;
    }
    [[nodiscard]] bool supportsExpiry() const {
        return roleColumn(ColumnRole::Expiration) != nullptr;
    }
    [[nodiscard]] bool auditTrail() const { return parts_.auditTrail; }
    [[nodiscard]] bool syncWithList() const { return parts_.syncWithList; }
    [[nodiscard]] const std::optional<std::chrono::seconds>& expirySpan() const {
        return parts_.expirySpan;
    }

    [[nodiscard]] bool hasAutoIncrementKey() const;

private:
    Parts parts_;
    std::vector<size_t> keyIndices_;
};

} // namespace persist::mapping

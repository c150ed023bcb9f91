#pragma once

#include <persist/core/result_helpers.hpp>
#include <persist/mapping/entity_mapping.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace persist::mapping {

/**
 * @brief Process-wide, append-only cache of entity mappings keyed by type
 *
 * Lookups take a shared lock. A miss builds the mapping outside the lock and
 * publishes it with insert-if-absent, so two racing builders may both compute
 * it but every caller observes the same fully built instance. Failed builds
 * are not cached. Entries are never evicted or replaced. A table name belongs
 * to the first type registered for it.
 */
class DescriptorCache {
public:
    static DescriptorCache& instance();

    template <MappedEntity T> Result<std::shared_ptr<const EntityMapping<T>>> get();

    /// Descriptor registered for a table name (case-insensitive), or nullptr
    [[nodiscard]] std::shared_ptr<const MappingDescriptor>
    findByTable(const std::string& tableName) const;

    [[nodiscard]] size_t size() const;

private:
    DescriptorCache() = default;

    [[nodiscard]] std::shared_ptr<const MappingBase> lookup(std::type_index type) const;
    /// Fails when another type already owns the table name
    Result<std::shared_ptr<const MappingBase>>
    insertIfAbsent(std::type_index type, std::shared_ptr<const MappingBase> mapping);

    // Types whose describe() is running on this thread; catches foreign-key cycles
    static std::vector<std::type_index>& buildingStack();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const MappingBase>> byType_;
    std::unordered_map<std::string, std::shared_ptr<const MappingDescriptor>> byTable_;
};

/**
 * @brief Mapping for T, built and cached on first use
 */
template <MappedEntity T> Result<std::shared_ptr<const EntityMapping<T>>> mappingFor() {
    return DescriptorCache::instance().get<T>();
}

template <MappedEntity T> Result<std::shared_ptr<const EntityMapping<T>>> DescriptorCache::get() {
    const std::type_index type(typeid(T));
    if (auto cached = lookup(type)) {
        return std::static_pointer_cast<const EntityMapping<T>>(cached);
    }

    auto& stack = buildingStack();
    if (std::find(stack.begin(), stack.end(), type) != stack.end()) {
        return makeMappingError(
            "Cyclic foreign-key registration; reference the table by name on one side");
    }

    stack.push_back(type);
    auto popBuilding = scope_exit([&stack] { stack.pop_back(); });
    MappingBuilder<T> builder;
    EntityTraits<T>::describe(builder);
    auto built = builder.build();

    if (!built) {
        spdlog::error("[Mapping] {}", built.error().message);
        return built.error();
    }

    PERSIST_TRY_UNWRAP(winner, insertIfAbsent(type, std::move(built).value()));
    return std::static_pointer_cast<const EntityMapping<T>>(winner);
}

} // namespace persist::mapping

#pragma once

#include <persist/core/types.h>
#include <persist/core/value.h>
#include <persist/mapping/mapping_descriptor.h>
#include <persist/mapping/sql_dialect.h>
#include <persist/query/order_by.h>
#include <persist/query/predicate.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace persist::query {

/// Placeholder name and bound value, in placeholder order
using Parameters = std::vector<std::pair<std::string, Value>>;

/**
 * @brief SQL fragment plus the values for its placeholders
 *
 * An empty sql means "no filter".
 */
struct TranslatedPredicate {
    std::string sql;
    Parameters parameters;

    [[nodiscard]] bool empty() const { return sql.empty(); }
};

struct SelectOptions {
    bool includeDeleted = false;
    bool includeExpired = false;
    std::optional<OrderSpec> orderBy;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

struct TranslatedQuery {
    std::string sql;
    Parameters parameters;
};

/**
 * @brief Turns predicate trees and orderings into SQL for one mapped type
 *
 * Literals become placeholders @p0, @p1, ... in left-to-right tree order, one per
 * literal with no de-duplication. Binary nodes are parenthesized so the emitted
 * SQL keeps the tree's grouping. Field names resolve through the descriptor;
 * unknown fields fail with MappingError, untranslatable shapes with
 * UnsupportedExpression. Translation is pure and deterministic.
 */
class ExpressionTranslator {
public:
    explicit ExpressionTranslator(const mapping::MappingDescriptor& descriptor,
                                  const mapping::SqlDialect& dialect = mapping::sqliteDialect());

    [[nodiscard]] Result<TranslatedPredicate> translatePredicate(const Predicate& predicate) const;

    /// "ORDER BY Name ASC, Value DESC", or "" when no ordering is given
    [[nodiscard]] Result<std::string>
    translateOrderBy(const std::optional<OrderSpec>& order) const;

    /**
     * @brief Full SELECT: columns, WHERE (predicate, then soft-delete and expiry
     * filters unless opted out), ORDER BY, LIMIT/OFFSET
     */
    [[nodiscard]] Result<TranslatedQuery> translateSelect(const Predicate& predicate,
                                                          const SelectOptions& options) const;

    /// SELECT COUNT(*) with the same WHERE composition as translateSelect
    [[nodiscard]] Result<TranslatedQuery> translateCount(const Predicate& predicate,
                                                         const SelectOptions& options) const;

private:
    Result<std::vector<std::string>> whereConditions(const Predicate& predicate,
                                                     const SelectOptions& options,
                                                     Parameters& parameters) const;
    Result<std::string> orderTerms(const OrderSpec& order) const;

    const mapping::MappingDescriptor& descriptor_;
    const mapping::SqlDialect& dialect_;
};

} // namespace persist::query

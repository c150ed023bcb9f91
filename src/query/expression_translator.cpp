#include <persist/mapping/schema_generator.h>
#include <persist/query/expression_translator.h>
#include <persist/query/select_builder.h>

#include <fmt/format.h>

namespace persist::query {

using mapping::ColumnDescriptor;
using mapping::ColumnType;

namespace {

const char* sqlOperator(CompareOp op) {
    switch (op) {
        case CompareOp::Equal: return "=";
        case CompareOp::NotEqual: return "<>";
        case CompareOp::Less: return "<";
        case CompareOp::LessOrEqual: return "<=";
        case CompareOp::Greater: return ">";
        case CompareOp::GreaterOrEqual: return ">=";
    }
    return "=";
}

std::string likePattern(StringMatch match, const std::string& text) {
    switch (match) {
        case StringMatch::Contains: return "%" + text + "%";
        case StringMatch::StartsWith: return text + "%";
        case StringMatch::EndsWith: return "%" + text;
    }
    return text;
}

// One walk over a tree; owns the placeholder counter for that walk
class Walker {
public:
    Walker(const mapping::MappingDescriptor& descriptor, const mapping::SqlDialect& dialect,
           Parameters& parameters)
        : descriptor_(descriptor), dialect_(dialect), parameters_(parameters) {}

    Result<std::string> walk(const Predicate& predicate, const char* parentKind) {
        if (predicate.empty()) {
            return makeUnsupportedExpression(parentKind, "operand is an empty predicate");
        }
        return std::visit([this](const auto& node) { return visit(node); },
                          predicate.node()->kind);
    }

private:
    Result<const ColumnDescriptor*> column(const FieldRef& ref) {
        const auto* col = descriptor_.findByField(ref.name);
        if (!col) {
            return makeMappingError(fmt::format("Unknown field '{}' on '{}'", ref.name,
                                                descriptor_.entityName()));
        }
        return col;
    }

    std::string bind(Value value) {
        auto name = fmt::format("@p{}", parameters_.size());
        parameters_.emplace_back(name, std::move(value));
        return name;
    }

    Result<std::string> visit(const Compare& node) {
        const auto* lhsField = std::get_if<FieldRef>(&node.lhs);
        const auto* rhsField = std::get_if<FieldRef>(&node.rhs);
        if (!lhsField && !rhsField) {
            return makeUnsupportedExpression("Compare", "neither side references a field");
        }

        // The field side decides how the literal side is rendered
        const ColumnDescriptor* anchor = nullptr;
        for (const auto* ref : {lhsField, rhsField}) {
            if (!ref)
                continue;
            auto col = column(*ref);
            if (!col)
                return col.error();
            if (!anchor)
                anchor = col.value();
        }

        auto render = [&](const Operand& operand) -> Result<std::string> {
            if (const auto* ref = std::get_if<FieldRef>(&operand)) {
                auto col = column(*ref);
                if (!col)
                    return col.error();
                return dialect_.comparableColumn(*col.value());
            }
            const auto& literal = std::get<Literal>(operand);
            if (isNull(literal.value)) {
                return makeUnsupportedExpression("Compare",
                                                 "null literal; use isNull() or isNotNull()");
            }
            return dialect_.comparableParameter(bind(literal.value), anchor->type);
        };

        auto lhs = render(node.lhs);
        if (!lhs)
            return lhs.error();
        auto rhs = render(node.rhs);
        if (!rhs)
            return rhs.error();
        return fmt::format("({} {} {})", lhs.value(), sqlOperator(node.op), rhs.value());
    }

    Result<std::string> visit(const And& node) { return binary(node.lhs, node.rhs, "AND", "And"); }

    Result<std::string> visit(const Or& node) { return binary(node.lhs, node.rhs, "OR", "Or"); }

    Result<std::string> visit(const Not& node) {
        auto inner = walk(node.operand, "Not");
        if (!inner)
            return inner.error();
        return "(NOT " + inner.value() + ")";
    }

    Result<std::string> visit(const StringOp& node) {
        auto col = column(node.field);
        if (!col)
            return col.error();
        if (col.value()->type != ColumnType::Text) {
            return makeUnsupportedExpression(
                "StringOp", fmt::format("field '{}' is not text", node.field.name));
        }
        const auto* text = std::get_if<std::string>(&node.text.value);
        if (!text) {
            return makeUnsupportedExpression("StringOp", "pattern is not a string");
        }
        auto placeholder = bind(likePattern(node.match, *text));
        return fmt::format("({} LIKE {})", dialect_.quoteIdentifier(col.value()->columnName),
                           placeholder);
    }

    Result<std::string> visit(const NullCheck& node) {
        auto col = column(node.field);
        if (!col)
            return col.error();
        return fmt::format("({} IS {}NULL)", dialect_.quoteIdentifier(col.value()->columnName),
                           node.isNull ? "" : "NOT ");
    }

    Result<std::string> visit(const In& node) {
        auto col = column(node.field);
        if (!col)
            return col.error();
        if (node.values.empty()) {
            return makeUnsupportedExpression("In", "empty value list");
        }
        std::string list;
        for (const auto& value : node.values) {
            if (isNull(value)) {
                return makeUnsupportedExpression("In", "null in value list");
            }
            if (!list.empty())
                list += ", ";
            list += dialect_.comparableParameter(bind(value), col.value()->type);
        }
        return fmt::format("({} IN ({}))", dialect_.comparableColumn(*col.value()), list);
    }

    Result<std::string> binary(const Predicate& lhs, const Predicate& rhs, const char* keyword,
                               const char* kind) {
        auto left = walk(lhs, kind);
        if (!left)
            return left.error();
        auto right = walk(rhs, kind);
        if (!right)
            return right.error();
        return fmt::format("({} {} {})", left.value(), keyword, right.value());
    }

    const mapping::MappingDescriptor& descriptor_;
    const mapping::SqlDialect& dialect_;
    Parameters& parameters_;
};

} // namespace

ExpressionTranslator::ExpressionTranslator(const mapping::MappingDescriptor& descriptor,
                                           const mapping::SqlDialect& dialect)
    : descriptor_(descriptor), dialect_(dialect) {}

Result<TranslatedPredicate>
ExpressionTranslator::translatePredicate(const Predicate& predicate) const {
    TranslatedPredicate out;
    if (predicate.empty())
        return out;

    Walker walker(descriptor_, dialect_, out.parameters);
    auto sql = walker.walk(predicate, "Predicate");
    if (!sql)
        return sql.error();
    out.sql = std::move(sql).value();
    return out;
}

Result<std::string> ExpressionTranslator::orderTerms(const OrderSpec& order) const {
    std::string terms;
    for (const auto& key : order.keys()) {
        const auto* col = descriptor_.findByField(key.field);
        if (!col) {
            return makeMappingError(fmt::format("Unknown ordering field '{}' on '{}'", key.field,
                                                descriptor_.entityName()));
        }
        if (!terms.empty())
            terms += ", ";
        terms += dialect_.quoteIdentifier(col->columnName);
        terms += key.descending ? " DESC" : " ASC";
    }
    return terms;
}

Result<std::string>
ExpressionTranslator::translateOrderBy(const std::optional<OrderSpec>& order) const {
    if (!order || order->keys().empty())
        return std::string{};
    auto terms = orderTerms(*order);
    if (!terms)
        return terms.error();
    return "ORDER BY " + terms.value();
}

Result<std::vector<std::string>>
ExpressionTranslator::whereConditions(const Predicate& predicate, const SelectOptions& options,
                                      Parameters& parameters) const {
    std::vector<std::string> conditions;
    auto translated = translatePredicate(predicate);
    if (!translated)
        return translated.error();
    if (!translated.value().empty()) {
        conditions.push_back(translated.value().sql);
        parameters = std::move(translated.value().parameters);
    }
    if (!options.includeDeleted) {
        if (auto filter = mapping::softDeleteFilter(descriptor_, dialect_); !filter.empty())
            conditions.push_back(std::move(filter));
    }
    if (!options.includeExpired) {
        if (auto filter = mapping::expiryFilter(descriptor_, dialect_); !filter.empty())
            conditions.push_back(std::move(filter));
    }
    return conditions;
}

Result<TranslatedQuery> ExpressionTranslator::translateSelect(const Predicate& predicate,
                                                              const SelectOptions& options) const {
    if ((options.limit && *options.limit < 0) || (options.offset && *options.offset < 0)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Negative paging (limit {}, offset {})",
                                 options.limit.value_or(0), options.offset.value_or(0))};
    }
    TranslatedQuery out;
    auto conditions = whereConditions(predicate, options, out.parameters);
    if (!conditions)
        return conditions.error();

    QuerySpec spec;
    spec.table = dialect_.quoteIdentifier(descriptor_.tableName());
    for (const auto& col : descriptor_.columns())
        spec.columns.push_back(dialect_.quoteIdentifier(col.columnName));
    spec.conditions = std::move(conditions).value();
    if (options.orderBy && !options.orderBy->keys().empty()) {
        auto terms = orderTerms(*options.orderBy);
        if (!terms)
            return terms.error();
        spec.orderBy = std::move(terms).value();
    }
    spec.limit = options.limit;
    spec.offset = options.offset;

    out.sql = buildSelect(spec);
    return out;
}

Result<TranslatedQuery> ExpressionTranslator::translateCount(const Predicate& predicate,
                                                             const SelectOptions& options) const {
    TranslatedQuery out;
    auto conditions = whereConditions(predicate, options, out.parameters);
    if (!conditions)
        return conditions.error();

    QuerySpec spec;
    spec.table = dialect_.quoteIdentifier(descriptor_.tableName());
    spec.conditions = std::move(conditions).value();
    out.sql = buildCount(spec);
    return out;
}

} // namespace persist::query

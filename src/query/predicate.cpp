#include <persist/query/predicate.h>

namespace persist::query {

namespace {

template <typename N> Predicate wrap(N node) {
    return Predicate(std::make_shared<const Node>(Node{std::move(node)}));
}

} // namespace

const char* nodeKindName(const Node& node) {
    struct Visitor {
        const char* operator()(const Compare&) const { return "Compare"; }
        const char* operator()(const And&) const { return "And"; }
        const char* operator()(const Or&) const { return "Or"; }
        const char* operator()(const Not&) const { return "Not"; }
        const char* operator()(const StringOp&) const { return "StringOp"; }
        const char* operator()(const NullCheck&) const { return "NullCheck"; }
        const char* operator()(const In&) const { return "In"; }
    };
    return std::visit(Visitor{}, node.kind);
}

Predicate makePredicate(Compare node) {
    return wrap(std::move(node));
}
Predicate makePredicate(And node) {
    return wrap(std::move(node));
}
Predicate makePredicate(Or node) {
    return wrap(std::move(node));
}
Predicate makePredicate(Not node) {
    return wrap(std::move(node));
}
Predicate makePredicate(StringOp node) {
    return wrap(std::move(node));
}
Predicate makePredicate(NullCheck node) {
    return wrap(std::move(node));
}
Predicate makePredicate(In node) {
    return wrap(std::move(node));
}

Predicate operator&&(const Predicate& lhs, const Predicate& rhs) {
    if (lhs.empty())
        return rhs;
    if (rhs.empty())
        return lhs;
    return makePredicate(And{lhs, rhs});
}

Predicate operator||(const Predicate& lhs, const Predicate& rhs) {
    if (lhs.empty())
        return rhs;
    if (rhs.empty())
        return lhs;
    return makePredicate(Or{lhs, rhs});
}

Predicate operator!(const Predicate& operand) {
    if (operand.empty())
        return operand;
    return makePredicate(Not{operand});
}

Predicate Field::operator==(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::Equal, other.ref_});
}
Predicate Field::operator!=(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::NotEqual, other.ref_});
}
Predicate Field::operator<(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::Less, other.ref_});
}
Predicate Field::operator<=(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::LessOrEqual, other.ref_});
}
Predicate Field::operator>(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::Greater, other.ref_});
}
Predicate Field::operator>=(const Field& other) const {
    return makePredicate(Compare{ref_, CompareOp::GreaterOrEqual, other.ref_});
}

Predicate Field::contains(std::string text) const {
    return makePredicate(StringOp{ref_, StringMatch::Contains, Literal{std::move(text)}});
}
Predicate Field::startsWith(std::string text) const {
    return makePredicate(StringOp{ref_, StringMatch::StartsWith, Literal{std::move(text)}});
}
Predicate Field::endsWith(std::string text) const {
    return makePredicate(StringOp{ref_, StringMatch::EndsWith, Literal{std::move(text)}});
}

Predicate Field::isNull() const {
    return makePredicate(NullCheck{ref_, true});
}
Predicate Field::isNotNull() const {
    return makePredicate(NullCheck{ref_, false});
}

Predicate Field::in(std::vector<Value> values) const {
    return makePredicate(In{ref_, std::move(values)});
}

} // namespace persist::query

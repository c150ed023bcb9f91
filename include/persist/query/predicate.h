#pragma once

#include <persist/core/value.h>

#include <concepts>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace persist::query {

/// Reference to a mapped field by its registered field name
struct FieldRef {
    std::string name;
};

/// Captured caller value
struct Literal {
    Value value;
};

using Operand = std::variant<FieldRef, Literal>;

enum class CompareOp { Equal, NotEqual, Less, LessOrEqual, Greater, GreaterOrEqual };

enum class StringMatch { Contains, StartsWith, EndsWith };

struct Node;

/**
 * @brief Immutable boolean expression tree over entity fields
 *
 * A default-constructed Predicate is empty and means "no filter". Subtrees are
 * shared, so copying a Predicate is cheap.
 */
class Predicate {
public:
    Predicate() = default;
    explicit Predicate(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    [[nodiscard]] bool empty() const { return node_ == nullptr; }
    [[nodiscard]] const Node* node() const { return node_.get(); }

private:
    std::shared_ptr<const Node> node_;
};

struct Compare {
    Operand lhs;
    CompareOp op;
    Operand rhs;
};

struct And {
    Predicate lhs;
    Predicate rhs;
};

struct Or {
    Predicate lhs;
    Predicate rhs;
};

struct Not {
    Predicate operand;
};

struct StringOp {
    FieldRef field;
    StringMatch match;
    Literal text;
};

struct NullCheck {
    FieldRef field;
    bool isNull = true;
};

struct In {
    FieldRef field;
    std::vector<Value> values;
};

struct Node {
    std::variant<Compare, And, Or, Not, StringOp, NullCheck, In> kind;
};

/// Node kind name used in UnsupportedExpression errors ("Compare", "In", ...)
const char* nodeKindName(const Node& node);

Predicate makePredicate(Compare node);
Predicate makePredicate(And node);
Predicate makePredicate(Or node);
Predicate makePredicate(Not node);
Predicate makePredicate(StringOp node);
Predicate makePredicate(NullCheck node);
Predicate makePredicate(In node);

/// Conjunction; an empty side yields the other side
Predicate operator&&(const Predicate& lhs, const Predicate& rhs);
/// Disjunction; an empty side yields the other side
Predicate operator||(const Predicate& lhs, const Predicate& rhs);
Predicate operator!(const Predicate& operand);

class Field;

template <typename V>
concept LiteralValue = !std::same_as<std::remove_cvref_t<V>, Field> &&
                       !std::same_as<std::remove_cvref_t<V>, FieldRef> &&
                       requires(const V& v) { persist::toValue(v); };

/**
 * @brief Fluent predicate construction
 *
 * @code
 * auto p = field("Name").contains("Smith") && field("Value") >= 10;
 * @endcode
 */
class Field {
public:
    explicit Field(std::string name) : ref_{std::move(name)} {}

    [[nodiscard]] const std::string& name() const { return ref_.name; }

    template <LiteralValue V> Predicate operator==(const V& v) const {
        return compare(CompareOp::Equal, v);
    }
    template <LiteralValue V> Predicate operator!=(const V& v) const {
        return compare(CompareOp::NotEqual, v);
    }
    template <LiteralValue V> Predicate operator<(const V& v) const {
        return compare(CompareOp::Less, v);
    }
    template <LiteralValue V> Predicate operator<=(const V& v) const {
        return compare(CompareOp::LessOrEqual, v);
    }
    template <LiteralValue V> Predicate operator>(const V& v) const {
        return compare(CompareOp::Greater, v);
    }
    template <LiteralValue V> Predicate operator>=(const V& v) const {
        return compare(CompareOp::GreaterOrEqual, v);
    }

    // Field-to-field comparisons
    Predicate operator==(const Field& other) const;
    Predicate operator!=(const Field& other) const;
    Predicate operator<(const Field& other) const;
    Predicate operator<=(const Field& other) const;
    Predicate operator>(const Field& other) const;
    Predicate operator>=(const Field& other) const;

    Predicate contains(std::string text) const;
    Predicate startsWith(std::string text) const;
    Predicate endsWith(std::string text) const;

    Predicate isNull() const;
    Predicate isNotNull() const;

    Predicate in(std::vector<Value> values) const;
    template <LiteralValue V> Predicate in(std::initializer_list<V> values) const {
        std::vector<Value> converted;
        converted.reserve(values.size());
        for (const auto& v : values)
            converted.push_back(persist::toValue(v));
        return in(std::move(converted));
    }

private:
    template <typename V> Predicate compare(CompareOp op, const V& v) const {
        return makePredicate(Compare{ref_, op, Literal{persist::toValue(v)}});
    }

    FieldRef ref_;
};

inline Field field(std::string name) {
    return Field(std::move(name));
}

} // namespace persist::query

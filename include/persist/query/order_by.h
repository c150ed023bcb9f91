#pragma once

#include <string>
#include <utility>
#include <vector>

namespace persist::query {

struct OrderKey {
    std::string field;
    bool descending = false;
};

/**
 * @brief Primary ordering key plus secondary keys, in declaration order
 *
 * @code
 * auto order = orderBy("Name").thenByDescending("Value");
 * @endcode
 */
class OrderSpec {
public:
    OrderSpec(std::string field, bool descending) {
        keys_.push_back({std::move(field), descending});
    }

    OrderSpec& thenBy(std::string field) {
        keys_.push_back({std::move(field), false});
        return *this;
    }

    OrderSpec& thenByDescending(std::string field) {
        keys_.push_back({std::move(field), true});
        return *this;
    }

    [[nodiscard]] const std::vector<OrderKey>& keys() const { return keys_; }

private:
    std::vector<OrderKey> keys_;
};

inline OrderSpec orderBy(std::string field) {
    return OrderSpec(std::move(field), false);
}

inline OrderSpec orderByDescending(std::string field) {
    return OrderSpec(std::move(field), true);
}

} // namespace persist::query

/**
 * @file ValueObject.hpp
 * @brief Base class for single-valued Value Objects in DDD
 */

#pragma once

#include <utility>

namespace epassport::shared::domain {

/**
 * @brief Immutable wrapper compared by value
 *
 * Subclasses validate in their factory and keep the constructor private.
 * Assignment replaces the whole object, so ids can be stored in containers.
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}

public:
    [[nodiscard]] const T& getValue() const noexcept { return value_; }

    friend bool operator==(const ValueObject& a, const ValueObject& b) { return a.value_ == b.value_; }
    friend bool operator!=(const ValueObject& a, const ValueObject& b) { return !(a == b); }
    friend bool operator<(const ValueObject& a, const ValueObject& b) { return a.value_ < b.value_; }
};

} // namespace epassport::shared::domain

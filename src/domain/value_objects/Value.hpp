#pragma once

#include "domain/value_objects/Quantity.hpp"

#include <ostream>
#include <string>
#include <variant>

namespace pqe::domain {

// Result of an operation that may cancel all dimensions: either a plain
// number or a Quantity.
class Value {
public:
    Value(double number) : value_(number) {}
    Value(Quantity quantity) : value_(std::move(quantity)) {}

    bool is_number() const noexcept { return std::holds_alternative<double>(value_); }
    bool is_quantity() const noexcept { return std::holds_alternative<Quantity>(value_); }

    // Throw IncompatibleOperand when the other alternative is held.
    double as_number() const;
    const Quantity& as_quantity() const;

    double to_double() const;
    std::string str() const;

    Value pow(const Value& exponent) const;

    const std::variant<double, Quantity>& variant() const noexcept { return value_; }

    friend Value operator+(const Value& lhs, const Value& rhs);
    friend Value operator-(const Value& lhs, const Value& rhs);
    friend Value operator*(const Value& lhs, const Value& rhs);
    friend Value operator/(const Value& lhs, const Value& rhs);
    friend Value operator-(const Value& operand);

    friend bool operator==(const Value& lhs, const Value& rhs);

    friend std::ostream& operator<<(std::ostream& os, const Value& v) { return os << v.str(); }

private:
    std::variant<double, Quantity> value_;
};

} // namespace pqe::domain

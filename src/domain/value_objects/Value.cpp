#include "domain/value_objects/Value.hpp"

#include <cmath>
#include <sstream>

namespace pqe::domain {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

double Value::as_number() const {
    if (const auto* number = std::get_if<double>(&value_)) {
        return *number;
    }
    throw IncompatibleOperand("Expected a plain number, got " + std::get<Quantity>(value_).str());
}

const Quantity& Value::as_quantity() const {
    if (const auto* quantity = std::get_if<Quantity>(&value_)) {
        return *quantity;
    }
    throw IncompatibleOperand("Expected a Quantity, got the plain number " + str());
}

double Value::to_double() const {
    return std::visit(overloaded{
        [](double number) { return number; },
        [](const Quantity& quantity) { return quantity.to_double(); },
    }, value_);
}

std::string Value::str() const {
    return std::visit(overloaded{
        [](double number) {
            std::ostringstream os;
            os << number;
            return os.str();
        },
        [](const Quantity& quantity) { return quantity.str(); },
    }, value_);
}

Value Value::pow(const Value& exponent) const {
    if (const auto* quantity = std::get_if<Quantity>(&value_)) {
        return quantity->pow(exponent);
    }
    if (exponent.is_quantity()) {
        throw DimensionMismatch(
            "Cannot raise a number to the power of a Quantity (" + exponent.str() + ")");
    }
    return std::pow(as_number(), exponent.as_number());
}

// Each binary operator forwards to the Quantity/number overloads, which
// own the dimensional rules.

Value operator+(const Value& lhs, const Value& rhs) {
    return std::visit([](const auto& a, const auto& b) -> Value { return a + b; },
                      lhs.value_, rhs.value_);
}

Value operator-(const Value& lhs, const Value& rhs) {
    return std::visit([](const auto& a, const auto& b) -> Value { return a - b; },
                      lhs.value_, rhs.value_);
}

Value operator*(const Value& lhs, const Value& rhs) {
    return std::visit([](const auto& a, const auto& b) -> Value { return a * b; },
                      lhs.value_, rhs.value_);
}

Value operator/(const Value& lhs, const Value& rhs) {
    return std::visit(overloaded{
        [](double a, double b) -> Value {
            if (b == 0.0) throw IncompatibleOperand("Division by zero");
            return a / b;
        },
        [](const auto& a, const auto& b) -> Value { return a / b; },
    }, lhs.value_, rhs.value_);
}

Value operator-(const Value& operand) {
    return std::visit([](const auto& a) -> Value { return -a; }, operand.value_);
}

bool operator==(const Value& lhs, const Value& rhs) {
    return std::visit(overloaded{
        [](double a, double b) { return a == b; },
        [](const Quantity& a, const Quantity& b) { return a == b; },
        [](const Quantity& a, double b) { return a == b; },
        [](double a, const Quantity& b) { return b == a; },
    }, lhs.value_, rhs.value_);
}

} // namespace pqe::domain

#pragma once

#include "domain/value_objects/Dimensions.hpp"
#include "domain/value_objects/Errors.hpp"
#include "repositories/IUnitRegistry.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pqe::domain {

class Value;

// A physical quantity: magnitude in SI base-unit terms, its dimensions, and
// the factor that selects the display unit (displayed value = value * factor).
// Immutable; every operation returns a new instance.
class Quantity {
public:
    using RegistryPtr = std::shared_ptr<const pqe::repositories::IUnitRegistry>;

    static constexpr int kDefaultPrecision = 3;
    // Decimal places used for equality and ordering.
    static constexpr int kComparisonDigits = 6;

    Quantity(double value, Dimensions dimensions, double factor = 1.0,
             int precision = kDefaultPrecision, std::string prefix = "",
             RegistryPtr registry = nullptr);

    double value() const noexcept { return value_; }
    const Dimensions& dimensions() const noexcept { return dimensions_; }
    double factor() const noexcept { return factor_; }
    int precision() const noexcept { return precision_; }
    const std::string& prefix() const noexcept { return prefix_; }
    const RegistryPtr& registry() const noexcept { return registry_; }

    Quantity prefixed(const std::string& prefix) const;
    Quantity to(const std::string& unit_name) const;
    // Unit names `to()` accepts for these dimensions.
    std::vector<std::string> alternatives() const;
    Quantity round(int precision) const;
    Quantity si() const;

    // (magnitude, unit-only quantity). With base_value the magnitude is
    // value * factor and the unit quantity displays as one unit; otherwise
    // the magnitude is to_double() and the unit quantity has value 1.
    std::pair<double, Quantity> split(bool base_value = true) const;

    Value pow(const Value& exponent) const;
    Value sqrt(int n = 2) const;
    Quantity abs() const;

    double to_double() const;
    long long to_int() const;

    std::string str() const;
    std::string html() const;
    std::string latex() const;
    std::string debug_string() const;

    // Consistent with ==: hashes dimensions and the comparison-rounded value.
    std::size_t hash() const;

    Quantity& operator+=(const Quantity&) = delete;
    Quantity& operator+=(double) = delete;
    Quantity& operator-=(const Quantity&) = delete;
    Quantity& operator-=(double) = delete;
    Quantity& operator*=(const Quantity&) = delete;
    Quantity& operator*=(double) = delete;
    Quantity& operator/=(const Quantity&) = delete;
    Quantity& operator/=(double) = delete;

    friend Quantity operator+(const Quantity& lhs, const Quantity& rhs);
    friend Quantity operator+(const Quantity& lhs, double rhs);
    friend Quantity operator+(double lhs, const Quantity& rhs);
    friend Quantity operator-(const Quantity& lhs, const Quantity& rhs);
    friend Quantity operator-(const Quantity& lhs, double rhs);
    friend Quantity operator-(double lhs, const Quantity& rhs);
    friend Quantity operator-(const Quantity& operand);

    // Quantity x Quantity may cancel to a plain number.
    friend Value operator*(const Quantity& lhs, const Quantity& rhs);
    friend Quantity operator*(const Quantity& lhs, double rhs);
    friend Quantity operator*(double lhs, const Quantity& rhs);
    friend Value operator/(const Quantity& lhs, const Quantity& rhs);
    friend Quantity operator/(const Quantity& lhs, double rhs);
    friend Quantity operator/(double lhs, const Quantity& rhs);

    // Comparisons across dimensions throw DimensionMismatch.
    friend bool operator==(const Quantity& lhs, const Quantity& rhs);
    friend std::partial_ordering operator<=>(const Quantity& lhs, const Quantity& rhs);
    friend bool operator==(const Quantity& lhs, double rhs);
    friend std::partial_ordering operator<=>(const Quantity& lhs, double rhs);
    // Never equal to text.
    friend bool operator==(const Quantity&, std::string_view) { return false; }

    friend std::ostream& operator<<(std::ostream& os, const Quantity& q) { return os << q.str(); }

private:
    Value raise(const Exponent& exponent) const;
    double comparable_value() const;

    double value_;
    Dimensions dimensions_;
    double factor_;
    int precision_;
    std::string prefix_;
    RegistryPtr registry_;
};

} // namespace pqe::domain

template <>
struct std::hash<pqe::domain::Quantity> {
    std::size_t operator()(const pqe::domain::Quantity& q) const { return q.hash(); }
};

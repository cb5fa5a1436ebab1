#include "domain/value_objects/Quantity.hpp"

#include "domain/resolution/QuantityFormatter.hpp"
#include "domain/resolution/UnitResolver.hpp"
#include "domain/value_objects/Prefix.hpp"
#include "domain/value_objects/Value.hpp"

#include <boost/functional/hash.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>

namespace pqe::domain {

namespace {

constexpr int kMaxExponentDenominator = 1000;
constexpr double kExponentTolerance = 1e-9;

double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

// Exponents must be exact rationals so dimensions stay exact.
std::optional<Exponent> exact_exponent(double exponent) {
    if (!std::isfinite(exponent)) return std::nullopt;
    for (int den = 1; den <= kMaxExponentDenominator; ++den) {
        double num = std::round(exponent * den);
        if (std::abs(num / den - exponent) <= kExponentTolerance &&
            std::abs(num) < 1e9) {
            return Exponent(static_cast<int>(num), den);
        }
    }
    return std::nullopt;
}

void require_finite(double operand, const char* operation) {
    if (!std::isfinite(operand)) {
        throw IncompatibleOperand(
            std::string("Cannot ") + operation + " a Quantity and a non-finite number");
    }
}

void require_nonzero(double divisor) {
    if (divisor == 0.0) {
        throw IncompatibleOperand("Division of a Quantity by zero");
    }
}

void require_same_dimensions(const Quantity& lhs, const Quantity& rhs, const char* operation) {
    if (lhs.dimensions() != rhs.dimensions()) {
        throw DimensionMismatch(
            std::string("Cannot ") + operation + " between " + lhs.str() + " and " +
            rhs.str() + ": dimensions are incompatible (" + lhs.dimensions().to_string() +
            " vs " + rhs.dimensions().to_string() + ")");
    }
}

// Product or quotient of two quantities. The combined factor survives only
// when it names a registered unit for the new dimensions.
Value combine(const Quantity& lhs, double value, const Dimensions& dims, double factor) {
    if (dims.is_zero()) {
        return value;
    }
    UnitResolver resolver(lhs.registry().get());
    if (!resolver.has_matching_unit(factor, dims)) {
        factor = 1.0;
    }
    return Quantity(value, dims, factor, lhs.precision(), "", lhs.registry());
}

} // namespace

Quantity::Quantity(double value, Dimensions dimensions, double factor, int precision,
                   std::string prefix, RegistryPtr registry)
    : value_(value)
    , dimensions_(std::move(dimensions))
    , factor_(factor)
    , precision_(precision)
    , prefix_(std::move(prefix))
    , registry_(std::move(registry)) {
    if (!(factor > 0.0) || !std::isfinite(factor)) {
        throw std::out_of_range(
            "Quantity factor must be positive and finite, got: " + std::to_string(factor));
    }
    if (precision < 0) {
        throw std::out_of_range(
            "Quantity precision must be non-negative, got: " + std::to_string(precision));
    }
    if (!prefix_.empty()) {
        if (factor_ != 1.0) {
            throw InvalidPrefixRequest("Cannot prefix a Quantity that has a factor");
        }
        if (!Prefix::is_valid(prefix_)) {
            throw InvalidPrefixRequest("Unknown prefix: " + prefix_);
        }
    }
}

Quantity Quantity::prefixed(const std::string& prefix) const {
    if (factor_ != 1.0) {
        throw InvalidPrefixRequest("Cannot prefix a Quantity that has a factor");
    }
    return Quantity(value_, dimensions_, factor_, precision_, prefix, registry_);
}

Quantity Quantity::to(const std::string& unit_name) const {
    std::optional<UnitDefinition> unit;
    if (registry_) {
        unit = registry_->find(unit_name);
    }
    if (!unit) {
        throw UnknownUnit("No unit named '" + unit_name + "' in the registry");
    }

    if (unit->dimensions == dimensions_) {
        return Quantity(value_, dimensions_, unit->factor, precision_, "", registry_);
    }

    auto decomposition = UnitResolver(registry_.get()).powers_of_derived(dimensions_);
    if (unit->dimensions == decomposition.basis) {
        double factor = std::pow(unit->factor, decomposition.power);
        return Quantity(value_, dimensions_, factor, precision_, "", registry_);
    }

    throw DimensionMismatch(
        "Unit '" + unit_name + "' is not an alternative for " + dimensions_.to_string());
}

std::vector<std::string> Quantity::alternatives() const {
    std::vector<std::string> names;
    if (!registry_) return names;

    auto append = [&](const Dimensions& dims) {
        for (auto kind : {UnitKind::DERIVED, UnitKind::DEFINED}) {
            for (const auto& unit : registry_->units_by_dimension(dims, kind)) {
                if (std::find(names.begin(), names.end(), unit.name) == names.end()) {
                    names.push_back(unit.name);
                }
            }
        }
    };

    append(dimensions_);
    auto decomposition = UnitResolver(registry_.get()).powers_of_derived(dimensions_);
    if (decomposition.basis != dimensions_) {
        append(decomposition.basis);
    }
    return names;
}

Quantity Quantity::round(int precision) const {
    return Quantity(value_, dimensions_, factor_, precision, prefix_, registry_);
}

Quantity Quantity::si() const {
    return Quantity(value_, dimensions_, 1.0, precision_, "", registry_);
}

std::pair<double, Quantity> Quantity::split(bool base_value) const {
    if (base_value) {
        return {value_ * factor_,
                Quantity(1.0 / factor_, dimensions_, factor_, precision_, "", registry_)};
    }
    return {to_double(), Quantity(1.0, dimensions_, factor_, precision_, "", registry_)};
}

Value Quantity::pow(const Value& exponent) const {
    if (exponent.is_quantity()) {
        throw DimensionMismatch(
            "Cannot raise a Quantity to the power of another Quantity (" + str() + " ** " +
            exponent.as_quantity().str() + ")");
    }
    auto exact = exact_exponent(exponent.as_number());
    if (!exact) {
        throw IncompatibleOperand(
            "Exponent must be a rational number, got: " + std::to_string(exponent.as_number()));
    }
    return raise(*exact);
}

Value Quantity::sqrt(int n) const {
    if (n == 0) {
        throw IncompatibleOperand("Cannot take the zeroth root of a Quantity");
    }
    return raise(Exponent(1, n));
}

Value Quantity::raise(const Exponent& exponent) const {
    double power = boost::rational_cast<double>(exponent);
    if (!prefix_.empty()) {
        // A forced prefix cannot be carried through the factor, so the
        // displayed number is raised instead.
        return std::pow(to_double(), power);
    }
    auto dims = dimensions_.multiply(exponent);
    double value = std::pow(value_, power);
    if (dims.is_zero()) {
        return value;
    }
    return Quantity(value, dims, std::pow(factor_, power), precision_, "", registry_);
}

Quantity Quantity::abs() const {
    if (value_ < 0) return *this * -1.0;
    return *this;
}

double Quantity::to_double() const {
    if (factor_ != 1.0) {
        return value_ * factor_;
    }
    if (prefix_.empty()) {
        return value_;
    }
    auto resolution = UnitResolver(registry_.get()).resolve(dimensions_, factor_);
    bool mass = UnitResolver::is_mass_basis(resolution.basis);
    return UnitResolver::prefixed_value(value_, resolution.power, prefix_, mass);
}

long long Quantity::to_int() const {
    return static_cast<long long>(to_double());
}

std::string Quantity::str() const {
    return QuantityFormatter(OutputTemplate::PLAIN).format(*this);
}

std::string Quantity::html() const {
    return QuantityFormatter(OutputTemplate::HTML).format(*this);
}

std::string Quantity::latex() const {
    return QuantityFormatter(OutputTemplate::LATEX).format(*this);
}

std::string Quantity::debug_string() const {
    std::ostringstream os;
    os << "Quantity(value=" << value_
       << ", dimensions=" << dimensions_.to_string()
       << ", factor=" << factor_
       << ", precision=" << precision_
       << ", prefix=" << prefix_ << ")";
    return os.str();
}

double Quantity::comparable_value() const {
    return round_to(value_, kComparisonDigits);
}

std::size_t Quantity::hash() const {
    std::size_t seed = 0;
    for (const auto& c : dimensions_.components()) {
        boost::hash_combine(seed, c.numerator());
        boost::hash_combine(seed, c.denominator());
    }
    double v = comparable_value();
    boost::hash_combine(seed, v == 0.0 ? 0.0 : v);
    return seed;
}

// --- Addition / subtraction ---

Quantity operator+(const Quantity& lhs, const Quantity& rhs) {
    require_same_dimensions(lhs, rhs, "add");
    return Quantity(lhs.value_ + rhs.value_, lhs.dimensions_, lhs.factor_, lhs.precision_,
                    lhs.prefix_, lhs.registry_);
}

// A bare number is a displayed value, so it is brought back to base terms.
Quantity operator+(const Quantity& lhs, double rhs) {
    require_finite(rhs, "add");
    return Quantity(lhs.value_ + rhs / lhs.factor_, lhs.dimensions_, lhs.factor_,
                    lhs.precision_, lhs.prefix_, lhs.registry_);
}

Quantity operator+(double lhs, const Quantity& rhs) {
    return rhs + lhs;
}

Quantity operator-(const Quantity& lhs, const Quantity& rhs) {
    require_same_dimensions(lhs, rhs, "subtract");
    return Quantity(lhs.value_ - rhs.value_, lhs.dimensions_, lhs.factor_, lhs.precision_,
                    lhs.prefix_, lhs.registry_);
}

Quantity operator-(const Quantity& lhs, double rhs) {
    require_finite(rhs, "subtract");
    return Quantity(lhs.value_ - rhs / lhs.factor_, lhs.dimensions_, lhs.factor_,
                    lhs.precision_, lhs.prefix_, lhs.registry_);
}

Quantity operator-(double lhs, const Quantity& rhs) {
    require_finite(lhs, "subtract");
    return Quantity(lhs / rhs.factor_ - rhs.value_, rhs.dimensions_, rhs.factor_,
                    rhs.precision_, rhs.prefix_, rhs.registry_);
}

Quantity operator-(const Quantity& operand) {
    return operand * -1.0;
}

// --- Multiplication / division ---

Value operator*(const Quantity& lhs, const Quantity& rhs) {
    return combine(lhs, lhs.value_ * rhs.value_, lhs.dimensions_.add(rhs.dimensions_),
                   lhs.factor_ * rhs.factor_);
}

Quantity operator*(const Quantity& lhs, double rhs) {
    require_finite(rhs, "multiply");
    return Quantity(lhs.value_ * rhs, lhs.dimensions_, lhs.factor_, lhs.precision_,
                    lhs.prefix_, lhs.registry_);
}

Quantity operator*(double lhs, const Quantity& rhs) {
    return rhs * lhs;
}

Value operator/(const Quantity& lhs, const Quantity& rhs) {
    require_nonzero(rhs.value_);
    return combine(lhs, lhs.value_ / rhs.value_, lhs.dimensions_.subtract(rhs.dimensions_),
                   lhs.factor_ / rhs.factor_);
}

Quantity operator/(const Quantity& lhs, double rhs) {
    require_finite(rhs, "divide");
    require_nonzero(rhs);
    return Quantity(lhs.value_ / rhs, lhs.dimensions_, lhs.factor_, lhs.precision_,
                    lhs.prefix_, lhs.registry_);
}

Quantity operator/(double lhs, const Quantity& rhs) {
    require_finite(lhs, "divide");
    require_nonzero(rhs.value_);
    auto dims = rhs.dimensions_.multiply(Exponent(-1));
    return Quantity(lhs / rhs.value_, dims, 1.0 / rhs.factor_, rhs.precision_, "",
                    rhs.registry_);
}

// --- Comparison ---

bool operator==(const Quantity& lhs, const Quantity& rhs) {
    require_same_dimensions(lhs, rhs, "compare");
    return lhs.comparable_value() == rhs.comparable_value();
}

std::partial_ordering operator<=>(const Quantity& lhs, const Quantity& rhs) {
    require_same_dimensions(lhs, rhs, "compare");
    return lhs.comparable_value() <=> rhs.comparable_value();
}

bool operator==(const Quantity& lhs, double rhs) {
    return lhs.comparable_value() == rhs;
}

std::partial_ordering operator<=>(const Quantity& lhs, double rhs) {
    return lhs.comparable_value() <=> rhs;
}

} // namespace pqe::domain

#include "domain/resolution/UnitResolver.hpp"

#include "domain/value_objects/Errors.hpp"
#include "domain/value_objects/Prefix.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace pqe::domain {

namespace {

constexpr double kLogEpsilon = 1e-9;
constexpr std::size_t kMassIndex = 0;

struct Candidate {
    int power;
    Dimensions basis;
    bool has_derived;
};

// True when `a` is the better decomposition.
bool better(const Candidate& a, const Candidate& b) {
    if (std::abs(a.power) != std::abs(b.power)) {
        return std::abs(a.power) > std::abs(b.power);
    }
    if (a.basis.nonzero_count() != b.basis.nonzero_count()) {
        return a.basis.nonzero_count() < b.basis.nonzero_count();
    }
    if ((a.power > 0) != (b.power > 0)) {
        return a.power > 0;
    }
    if (a.has_derived != b.has_derived) {
        return a.has_derived;
    }
    return a.basis < b.basis;
}

double scale_by_power_of_ten(double value, int exponent) {
    // Dividing by an exact power of ten rounds better than multiplying by
    // an inexact negative one.
    if (exponent >= 0) return value * std::pow(10.0, exponent);
    return value / std::pow(10.0, -exponent);
}

} // namespace

UnitResolver::UnitResolver(const pqe::repositories::IUnitRegistry* registry)
    : registry_(registry) {}

Decomposition UnitResolver::powers_of_derived(const Dimensions& dims) const {
    if (dims.is_zero()) return {1, dims};

    auto has_derived = [this](const Dimensions& basis) {
        return registry_ &&
               !registry_->units_by_dimension(basis, UnitKind::DERIVED).empty();
    };

    std::optional<Candidate> best;
    auto consider = [&](Candidate candidate) {
        if (!best || better(candidate, *best)) {
            best = std::move(candidate);
        }
    };

    if (registry_) {
        for (const auto& key : registry_->dimension_keys()) {
            if (auto k = dims.integer_multiple_of(key)) {
                consider({*k, key, has_derived(key)});
            }
        }
    }

    if (auto index = dims.single_component()) {
        const auto& exponent = dims[*index];
        if (exponent.denominator() == 1) {
            auto basis = Dimensions::basis(*index);
            consider({exponent.numerator(), basis, has_derived(basis)});
        }
    }

    if (!best) return {1, dims};
    return {best->power, best->basis};
}

Resolution UnitResolver::resolve(const Dimensions& dims, double factor) const {
    auto decomposition = powers_of_derived(dims);

    if (registry_ && !dims.is_zero()) {
        if (auto unit = registry_->find_by_factor(factor, dims, 1)) {
            return {1, dims, unit->symbol, unit->prefix_eligible};
        }
        if (decomposition.basis != dims) {
            if (auto unit = registry_->find_by_factor(factor, decomposition.basis,
                                                      decomposition.power)) {
                return {decomposition.power, decomposition.basis, unit->symbol,
                        unit->prefix_eligible};
            }
        }
    }

    // Only a whole power of one base unit can carry a prefix.
    auto index = decomposition.basis.single_component();
    bool prefixable = index && decomposition.basis[*index].denominator() == 1;
    return {decomposition.power, decomposition.basis, "", prefixable};
}

bool UnitResolver::has_matching_unit(double factor, const Dimensions& dims) const {
    if (factor == 1.0) return true;
    if (!registry_ || dims.is_zero()) return false;
    if (registry_->find_by_factor(factor, dims, 1)) return true;

    auto decomposition = powers_of_derived(dims);
    if (decomposition.basis == dims) return false;
    return registry_->find_by_factor(factor, decomposition.basis, decomposition.power)
        .has_value();
}

bool UnitResolver::is_mass_basis(const Dimensions& basis) {
    return basis == Dimensions::basis(kMassIndex);
}

std::string UnitResolver::auto_prefix(double value, int power, bool mass) {
    if (value == 0.0 || power == 0 || !std::isfinite(value)) return "";

    double shift = mass ? 3.0 * power : 0.0;
    double quotient = (std::log10(std::abs(value)) + shift) / (3.0 * power);
    double step = power > 0 ? std::floor(quotient + kLogEpsilon)
                            : std::ceil(quotient - kLogEpsilon);

    int prefix_power = std::clamp(static_cast<int>(step) * 3, Prefix::kMinPower, Prefix::kMaxPower);
    if (prefix_power == 0) return "";

    auto prefix = Prefix::from_power(prefix_power);
    return prefix ? prefix->symbol : "";
}

double UnitResolver::prefixed_value(double value, int power, const std::string& prefix, bool mass) {
    int prefix_power = 0;
    if (!prefix.empty()) {
        auto found = Prefix::from_symbol(prefix);
        if (!found) {
            throw InvalidPrefixRequest("Unknown prefix: " + prefix);
        }
        prefix_power = found->power_of_ten;
    }
    int shift = mass ? 3 * power : 0;
    return scale_by_power_of_ten(value, shift - prefix_power * power);
}

} // namespace pqe::domain

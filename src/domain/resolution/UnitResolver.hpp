#pragma once

#include "domain/value_objects/Dimensions.hpp"
#include "repositories/IUnitRegistry.hpp"

#include <string>

namespace pqe::domain {

// dims == power * basis
struct Decomposition {
    int power;
    Dimensions basis;
};

struct Resolution {
    int power;              // exponent carried by the symbol and the prefix
    Dimensions basis;
    std::string symbol;     // empty: compose from base-unit symbols
    bool prefix_eligible;

    bool composite() const noexcept { return symbol.empty(); }
};

// Decides which named unit and prefix a (dimensions, factor) pair displays
// as. Holds no state beyond the registry it reads; a null registry resolves
// everything to composite symbols.
class UnitResolver {
public:
    explicit UnitResolver(const pqe::repositories::IUnitRegistry* registry);

    // Largest integer power k and basis b with dims == k * b, searched over
    // the registry's dimension keys and the SI basis vectors. Ties prefer
    // fewer non-zero components in b, then positive k, then a b with a
    // named derived unit, then vector order. No decomposition: (1, dims).
    Decomposition powers_of_derived(const Dimensions& dims) const;

    Resolution resolve(const Dimensions& dims, double factor) const;

    // Whether `factor` names a registered unit for `dims`, either directly
    // or through its basis decomposition. A factor of 1 always does.
    bool has_matching_unit(double factor, const Dimensions& dims) const;

    static bool is_mass_basis(const Dimensions& basis);

    // Prefix bringing the mantissa of `value` (a quantity raised to `power`)
    // into [1, 1000). Mass is measured from the gram. Empty for no prefix.
    static std::string auto_prefix(double value, int power, bool mass);

    // `value` re-expressed with `prefix` applied to a unit raised to `power`.
    static double prefixed_value(double value, int power, const std::string& prefix, bool mass);

private:
    const pqe::repositories::IUnitRegistry* registry_;
};

} // namespace pqe::domain

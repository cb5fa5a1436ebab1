#pragma once

#include "domain/value_objects/Dimensions.hpp"

#include <stdexcept>
#include <string>

namespace pqe::domain {

// "derived": coherent SI unit with factor 1 (N, J, Pa).
// "defined": non-SI unit with a conversion factor (lb, ft, psi).
enum class UnitKind { DERIVED, DEFINED };

inline std::string to_string(UnitKind kind) {
    return kind == UnitKind::DERIVED ? "derived" : "defined";
}

inline UnitKind unit_kind_from_string(const std::string& str) {
    if (str == "derived") return UnitKind::DERIVED;
    if (str == "defined") return UnitKind::DEFINED;
    throw std::invalid_argument("Invalid unit kind: " + str);
}

struct UnitDefinition {
    std::string name;
    std::string symbol;
    Dimensions dimensions;
    double factor = 1.0;          // display value per base-unit value
    UnitKind kind = UnitKind::DERIVED;
    bool prefix_eligible = true;
};

} // namespace pqe::domain

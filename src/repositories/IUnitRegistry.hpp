#pragma once

#include "domain/value_objects/UnitDefinition.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pqe::repositories {

// Read-only catalog of named units. Population happens before any quantity
// resolves against it; nothing here mutates.
class IUnitRegistry {
public:
    // By-dimension index: units of `kind` registered exactly under `dims`,
    // in registration order.
    virtual std::vector<pqe::domain::UnitDefinition> units_by_dimension(
        const pqe::domain::Dimensions& dims, pqe::domain::UnitKind kind) const = 0;

    // Every dimension vector that has at least one unit, in vector order.
    virtual std::vector<pqe::domain::Dimensions> dimension_keys() const = 0;

    // By-factor index: the unit registered under `dims` whose factor matches
    // factor^(1/power). `power` must be non-zero.
    virtual std::optional<pqe::domain::UnitDefinition> find_by_factor(
        double factor, const pqe::domain::Dimensions& dims, int power) const = 0;

    virtual std::optional<pqe::domain::UnitDefinition> find(const std::string& name) const = 0;

    // Every unit in registration order.
    virtual std::vector<pqe::domain::UnitDefinition> units() const = 0;

    virtual std::size_t size() const = 0;

    virtual ~IUnitRegistry() = default;
};

} // namespace pqe::repositories

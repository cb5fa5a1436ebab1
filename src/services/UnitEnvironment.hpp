#pragma once

#include "domain/value_objects/Quantity.hpp"
#include "repositories/IUnitRegistry.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pqe::services {

// Explicit context for building quantities: one registry snapshot plus the
// display precision new quantities start with. Immutable once built; use a
// new environment to switch unit sets.
class UnitEnvironment {
public:
    explicit UnitEnvironment(std::shared_ptr<const pqe::repositories::IUnitRegistry> registry,
                             int precision = pqe::domain::Quantity::kDefaultPrecision);

    const std::shared_ptr<const pqe::repositories::IUnitRegistry>& registry() const noexcept {
        return registry_;
    }
    int precision() const noexcept { return precision_; }

    // kg, m, s, A, cd, K, mol in base-dimension order.
    const std::vector<std::pair<std::string, pqe::domain::Quantity>>& base_units() const noexcept {
        return base_units_;
    }
    pqe::domain::Quantity base(const std::string& symbol) const;

    // One unit of a registered unit: a derived unit has value 1; a defined
    // unit has value 1/factor so that it displays as 1.
    pqe::domain::Quantity unit(const std::string& name) const;

    // Every registered unit, keyed by name.
    std::map<std::string, pqe::domain::Quantity> units() const;

private:
    pqe::domain::Quantity make_unit(const pqe::domain::UnitDefinition& definition) const;

    std::shared_ptr<const pqe::repositories::IUnitRegistry> registry_;
    int precision_;
    std::vector<std::pair<std::string, pqe::domain::Quantity>> base_units_;
};

} // namespace pqe::services

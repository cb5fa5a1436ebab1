#include "services/UnitEnvironment.hpp"

#include <array>
#include <stdexcept>

using namespace pqe::domain;

namespace pqe::services {

namespace {

constexpr std::array<const char*, Dimensions::kArity> kBaseUnitSymbols = {
    "kg", "m", "s", "A", "cd", "K", "mol"};

} // namespace

UnitEnvironment::UnitEnvironment(std::shared_ptr<const pqe::repositories::IUnitRegistry> registry,
                                 int precision)
    : registry_(std::move(registry))
    , precision_(precision) {
    if (!registry_) {
        throw std::invalid_argument("UnitEnvironment requires a registry");
    }
    for (std::size_t i = 0; i < Dimensions::kArity; ++i) {
        base_units_.emplace_back(
            kBaseUnitSymbols[i],
            Quantity(1.0, Dimensions::basis(i), 1.0, precision_, "", registry_));
    }
}

Quantity UnitEnvironment::base(const std::string& symbol) const {
    for (const auto& [name, quantity] : base_units_) {
        if (name == symbol) return quantity;
    }
    throw UnknownUnit("No SI base unit with symbol '" + symbol + "'");
}

Quantity UnitEnvironment::unit(const std::string& name) const {
    auto definition = registry_->find(name);
    if (!definition) {
        throw UnknownUnit("No unit named '" + name + "' in the registry");
    }
    return make_unit(*definition);
}

std::map<std::string, Quantity> UnitEnvironment::units() const {
    std::map<std::string, Quantity> result;
    for (const auto& definition : registry_->units()) {
        result.emplace(definition.name, make_unit(definition));
    }
    return result;
}

Quantity UnitEnvironment::make_unit(const UnitDefinition& definition) const {
    return Quantity(1.0 / definition.factor, definition.dimensions, definition.factor,
                    precision_, "", registry_);
}

} // namespace pqe::services

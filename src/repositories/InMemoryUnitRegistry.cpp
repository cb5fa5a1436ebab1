#include "repositories/InMemoryUnitRegistry.hpp"

#include <cmath>
#include <stdexcept>

using namespace pqe::domain;

namespace pqe::repositories {

InMemoryUnitRegistry::InMemoryUnitRegistry(double factor_tolerance)
    : factor_tolerance_(factor_tolerance) {
    if (!(factor_tolerance >= 0.0) || !std::isfinite(factor_tolerance)) {
        throw std::out_of_range(
            "Factor tolerance must be finite and non-negative, got: " +
            std::to_string(factor_tolerance));
    }
}

void InMemoryUnitRegistry::add(UnitDefinition unit) {
    if (unit.name.empty()) {
        throw std::invalid_argument("Unit name must not be empty");
    }
    if (!(unit.factor > 0.0) || !std::isfinite(unit.factor)) {
        throw std::out_of_range(
            "Unit factor must be positive and finite for '" + unit.name +
            "', got: " + std::to_string(unit.factor));
    }
    if (unit.dimensions.is_zero()) {
        throw std::invalid_argument("Unit '" + unit.name + "' has no dimensions");
    }
    if (by_name_.count(unit.name) > 0) {
        throw std::invalid_argument("Unit already registered: " + unit.name);
    }
    if (unit.symbol.empty()) {
        unit.symbol = unit.name;
    }

    std::size_t index = units_.size();
    auto& kinds = by_dimension_[unit.dimensions];
    if (unit.kind == UnitKind::DERIVED) {
        kinds.derived.push_back(index);
    } else {
        kinds.defined.push_back(index);
    }
    by_factor_.emplace(unit.factor, index);
    by_name_.emplace(unit.name, index);
    units_.push_back(std::move(unit));
}

std::vector<UnitDefinition> InMemoryUnitRegistry::units_by_dimension(
    const Dimensions& dims, UnitKind kind) const {
    std::vector<UnitDefinition> result;
    auto it = by_dimension_.find(dims);
    if (it == by_dimension_.end()) return result;

    const auto& indices = kind == UnitKind::DERIVED ? it->second.derived : it->second.defined;
    result.reserve(indices.size());
    for (auto index : indices) {
        result.push_back(units_[index]);
    }
    return result;
}

std::vector<Dimensions> InMemoryUnitRegistry::dimension_keys() const {
    std::vector<Dimensions> keys;
    keys.reserve(by_dimension_.size());
    for (const auto& [dims, kinds] : by_dimension_) {
        keys.push_back(dims);
    }
    return keys;
}

std::optional<UnitDefinition> InMemoryUnitRegistry::find_by_factor(
    double factor, const Dimensions& dims, int power) const {
    if (power == 0 || !(factor > 0.0) || !std::isfinite(factor)) {
        return std::nullopt;
    }

    double target = power == 1 ? factor : std::pow(factor, 1.0 / power);
    double window = factor_tolerance_ * target;

    // Closest factor wins; among equal factors the first registered.
    std::optional<std::size_t> best;
    double best_distance = 0.0;
    auto end = by_factor_.upper_bound(target + window);
    for (auto it = by_factor_.lower_bound(target - window); it != end; ++it) {
        const auto& unit = units_[it->second];
        if (unit.dimensions != dims) continue;
        double distance = std::abs(it->first - target);
        if (!best || distance < best_distance) {
            best = it->second;
            best_distance = distance;
        }
    }

    if (!best) return std::nullopt;
    return units_[*best];
}

std::optional<UnitDefinition> InMemoryUnitRegistry::find(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return std::nullopt;
    return units_[it->second];
}

} // namespace pqe::repositories

#pragma once

#include "repositories/IUnitRegistry.hpp"

#include <map>
#include <string>
#include <vector>

namespace pqe::repositories {

class InMemoryUnitRegistry : public pqe::repositories::IUnitRegistry {
public:
    static constexpr double kDefaultFactorTolerance = 1e-9;

    explicit InMemoryUnitRegistry(double factor_tolerance = kDefaultFactorTolerance);

    // Registration; a second unit with an existing name throws.
    void add(pqe::domain::UnitDefinition unit);

    std::vector<pqe::domain::UnitDefinition> units_by_dimension(
        const pqe::domain::Dimensions& dims, pqe::domain::UnitKind kind) const override;

    std::vector<pqe::domain::Dimensions> dimension_keys() const override;

    std::optional<pqe::domain::UnitDefinition> find_by_factor(
        double factor, const pqe::domain::Dimensions& dims, int power) const override;

    std::optional<pqe::domain::UnitDefinition> find(const std::string& name) const override;

    std::vector<pqe::domain::UnitDefinition> units() const override { return units_; }

    std::size_t size() const override { return units_.size(); }

    double factor_tolerance() const noexcept { return factor_tolerance_; }

private:
    struct KindIndex {
        std::vector<std::size_t> derived;
        std::vector<std::size_t> defined;
    };

    double factor_tolerance_;
    std::vector<pqe::domain::UnitDefinition> units_;          // registration order
    std::map<std::string, std::size_t> by_name_;
    std::map<pqe::domain::Dimensions, KindIndex> by_dimension_;
    std::multimap<double, std::size_t> by_factor_;            // equal keys keep insertion order
};

} // namespace pqe::repositories

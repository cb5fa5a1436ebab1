#pragma once

#include "config/Settings.hpp"
#include "repositories/InMemoryUnitRegistry.hpp"

#include <memory>
#include <string>

namespace pqe::infrastructure {

// Builds a unit registry from a JSON environment document:
//
//   { "N":  {"Dimension": [1, 1, -2, 0, 0, 0, 0], "Symbol": "N"},
//     "lb": {"Dimension": [1, 0, 0, 0, 0, 0, 0], "Factor": 2.20462262185} }
//
// Entries without a factor (or with factor 1) are derived and prefixable;
// entries with a factor are defined and not. "Kind" ("derived"/"defined")
// and "Prefixed" override those defaults.
// Units are registered in document order.
class EnvironmentLoader {
public:
    explicit EnvironmentLoader(config::ResolutionSettings resolution = {});

    std::shared_ptr<repositories::InMemoryUnitRegistry> parse(const std::string& json_str) const;
    std::shared_ptr<repositories::InMemoryUnitRegistry> load_file(const std::string& path) const;
    std::shared_ptr<repositories::InMemoryUnitRegistry> load(
        const config::EnvironmentSettings& environment) const;

    static std::string path_for(const config::EnvironmentSettings& environment);

private:
    config::ResolutionSettings resolution_;
};

} // namespace pqe::infrastructure

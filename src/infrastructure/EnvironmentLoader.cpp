#include "infrastructure/EnvironmentLoader.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace pqe::domain;
using json = nlohmann::ordered_json;

namespace pqe::infrastructure {

namespace {

[[noreturn]] void fail(const std::string& name, const std::string& reason) {
    throw std::runtime_error("Invalid unit '" + name + "' in environment: " + reason);
}

Dimensions parse_dimension(const std::string& name, const json& entry) {
    if (!entry.contains("Dimension")) fail(name, "missing \"Dimension\"");

    const auto& dim = entry["Dimension"];
    if (!dim.is_array() || dim.size() != Dimensions::kArity) {
        fail(name, "\"Dimension\" must be an array of 7 integers");
    }

    Dimensions::Components components{};
    for (std::size_t i = 0; i < Dimensions::kArity; ++i) {
        if (!dim[i].is_number_integer()) {
            fail(name, "\"Dimension\" must be an array of 7 integers");
        }
        components[i] = Exponent(dim[i].get<int>());
    }
    Dimensions dims(components);
    if (dims.is_zero()) fail(name, "dimensionless units cannot be registered");
    return dims;
}

UnitDefinition parse_unit(const std::string& name, const json& entry) {
    if (!entry.is_object()) fail(name, "entry must be an object");

    UnitDefinition unit;
    unit.name = name;
    unit.symbol = name;
    unit.dimensions = parse_dimension(name, entry);

    if (entry.contains("Factor")) {
        const auto& factor = entry["Factor"];
        if (!factor.is_number()) fail(name, "\"Factor\" must be a number");
        unit.factor = factor.get<double>();
        if (!std::isfinite(unit.factor) || unit.factor <= 0.0) {
            fail(name, "\"Factor\" must be finite and positive");
        }
    }

    if (entry.contains("Symbol")) {
        const auto& symbol = entry["Symbol"];
        if (!symbol.is_string() || symbol.get<std::string>().empty()) {
            fail(name, "\"Symbol\" must be a non-empty string");
        }
        unit.symbol = symbol.get<std::string>();
    }

    unit.kind = unit.factor == 1.0 ? UnitKind::DERIVED : UnitKind::DEFINED;
    if (entry.contains("Kind")) {
        const auto& kind = entry["Kind"];
        if (!kind.is_string()) fail(name, "\"Kind\" must be \"derived\" or \"defined\"");
        try {
            unit.kind = unit_kind_from_string(kind.get<std::string>());
        } catch (const std::invalid_argument& e) {
            fail(name, e.what());
        }
    }
    unit.prefix_eligible = unit.kind == UnitKind::DERIVED;

    if (entry.contains("Prefixed")) {
        const auto& prefixed = entry["Prefixed"];
        if (!prefixed.is_boolean()) fail(name, "\"Prefixed\" must be true or false");
        unit.prefix_eligible = prefixed.get<bool>();
    }
    return unit;
}

} // anonymous namespace

EnvironmentLoader::EnvironmentLoader(config::ResolutionSettings resolution)
    : resolution_(resolution) {}

std::shared_ptr<repositories::InMemoryUnitRegistry> EnvironmentLoader::parse(
    const std::string& json_str) const {

    auto document = json::parse(json_str, nullptr, false);
    if (document.is_discarded()) {
        throw std::runtime_error("Environment is not valid JSON");
    }
    if (!document.is_object()) {
        throw std::runtime_error("Environment must be a JSON object keyed by unit name");
    }

    auto registry = std::make_shared<repositories::InMemoryUnitRegistry>(
        resolution_.factor_tolerance);
    for (const auto& [name, entry] : document.items()) {
        auto unit = parse_unit(name, entry);
        if (registry->find(unit.name)) fail(name, "duplicate unit name");
        registry->add(std::move(unit));
    }
    return registry;
}

std::shared_ptr<repositories::InMemoryUnitRegistry> EnvironmentLoader::load_file(
    const std::string& path) const {

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open environment file " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parse(content.str());
}

std::shared_ptr<repositories::InMemoryUnitRegistry> EnvironmentLoader::load(
    const config::EnvironmentSettings& environment) const {
    return load_file(path_for(environment));
}

std::string EnvironmentLoader::path_for(const config::EnvironmentSettings& environment) {
    return (std::filesystem::path(environment.directory) / (environment.name + ".json")).string();
}

} // namespace pqe::infrastructure

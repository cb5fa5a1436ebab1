#include "config/Settings.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace pqe::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return fallback;
    }
}

double env_double_or(const char* name, double fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        return fallback;
    }
}

} // namespace

Settings Settings::from_environment() {
    std::string profile = env_or("PQE_PROFILE", "engineering");
    Settings preset = (profile == "scientific") ? scientific() : engineering();
    Settings s = preset;

    // Out-of-range overrides keep the preset value
    int precision = env_int_or("PQE_PRECISION", preset.format.default_precision);
    s.format.default_precision = precision >= 0 ? precision : preset.format.default_precision;
    double tolerance = env_double_or("PQE_FACTOR_TOLERANCE", preset.resolution.factor_tolerance);
    s.resolution.factor_tolerance = std::isfinite(tolerance) && tolerance >= 0.0
        ? tolerance
        : preset.resolution.factor_tolerance;
    s.environment.name = env_or("PQE_ENVIRONMENT", s.environment.name);
    s.environment.directory = env_or("PQE_ENVIRONMENT_DIR", s.environment.directory);
    return s;
}

Settings Settings::engineering() {
    Settings s;
    s.format.default_precision = 3;
    s.environment.name = "structural";
    return s;
}

Settings Settings::scientific() {
    Settings s;
    s.format.default_precision = 6;
    s.resolution.factor_tolerance = 1e-12;
    s.environment.name = "default";
    return s;
}

} // namespace pqe::config

#pragma once

#include <string>

namespace pqe::config {

struct FormatSettings {
    int default_precision = 3;
};

struct ResolutionSettings {
    // Relative tolerance when matching a factor against registered units.
    double factor_tolerance = 1e-9;
};

struct EnvironmentSettings {
    std::string name = "default";           // "default" or "structural"
    std::string directory = "environments";
};

struct Settings {
    FormatSettings format;
    ResolutionSettings resolution;
    EnvironmentSettings environment;

    static Settings from_environment();
    static Settings engineering();
    static Settings scientific();
};

} // namespace pqe::config

#include "config/Settings.hpp"
#include "infrastructure/EnvironmentLoader.hpp"
#include "services/UnitEnvironment.hpp"

#include <iomanip>
#include <iostream>
#include <string>

namespace {

std::string render(const pqe::domain::Quantity& quantity, const std::string& style) {
    if (style == "html") return quantity.html();
    if (style == "latex") return quantity.latex();
    return quantity.str();
}

} // namespace

int main(int argc, char* argv[]) {
    auto settings = pqe::config::Settings::from_environment();

    // Optional CLI args: environment name, then output style
    if (argc >= 2) {
        settings.environment.name = argv[1];
    }
    std::string style = argc >= 3 ? argv[2] : "plain";
    if (style != "plain" && style != "html" && style != "latex") {
        std::cerr << "Usage: pqe_catalog [environment] [plain|html|latex]" << std::endl;
        return 1;
    }

    try {
        pqe::infrastructure::EnvironmentLoader loader(settings.resolution);
        auto path = pqe::infrastructure::EnvironmentLoader::path_for(settings.environment);
        auto registry = loader.load(settings.environment);
        std::cout << "[environment] Loaded " << registry->size() << " units from " << path
                  << std::endl;

        pqe::services::UnitEnvironment environment(registry, settings.format.default_precision);

        for (const auto& [symbol, quantity] : environment.base_units()) {
            std::cout << std::left << std::setw(8) << symbol << render(quantity, style)
                      << std::endl;
        }
        for (const auto& definition : registry->units()) {
            auto quantity = environment.unit(definition.name);
            std::cout << std::left << std::setw(8) << definition.name
                      << render(quantity, style) << " = " << render(quantity.si(), style)
                      << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[catalog] error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[catalog] Done." << std::endl;
    return 0;
}

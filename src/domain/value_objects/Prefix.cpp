#include "domain/value_objects/Prefix.hpp"

namespace pqe::domain {

const std::vector<Prefix>& Prefix::all() {
    static const std::vector<Prefix> prefixes = {
        {"Y", 24},  {"Z", 21},  {"E", 18},  {"P", 15},  {"T", 12},
        {"G", 9},   {"M", 6},   {"k", 3},   {"h", 2},   {"da", 1},
        {"d", -1},  {"c", -2},  {"m", -3},  {"μ", -6},  {"n", -9},
        {"p", -12}, {"f", -15}, {"a", -18}, {"z", -21}, {"y", -24},
    };
    return prefixes;
}

std::optional<Prefix> Prefix::from_symbol(const std::string& symbol) {
    for (const auto& prefix : all()) {
        if (prefix.symbol == symbol) return prefix;
    }
    return std::nullopt;
}

std::optional<Prefix> Prefix::from_power(int power_of_ten) {
    for (const auto& prefix : all()) {
        if (prefix.power_of_ten == power_of_ten) return prefix;
    }
    return std::nullopt;
}

bool Prefix::is_valid(const std::string& symbol) {
    return from_symbol(symbol).has_value();
}

} // namespace pqe::domain

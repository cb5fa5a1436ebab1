#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pqe::domain {

struct Prefix {
    std::string symbol;
    int power_of_ten;

    static const std::vector<Prefix>& all();

    // Recognized prefix by symbol ("k", "μ", "da", ...).
    static std::optional<Prefix> from_symbol(const std::string& symbol);
    static std::optional<Prefix> from_power(int power_of_ten);
    static bool is_valid(const std::string& symbol);

    static constexpr int kMinPower = -24;
    static constexpr int kMaxPower = 24;
};

} // namespace pqe::domain

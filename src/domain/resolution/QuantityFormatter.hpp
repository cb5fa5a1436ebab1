#pragma once

#include "domain/value_objects/Dimensions.hpp"

#include <string>

namespace pqe::domain {

class Quantity;

enum class OutputTemplate { PLAIN, HTML, LATEX };

// Renders quantities as "<value><separator><unit><exponent>" in one of
// three markups. Pure; resolution happens against the quantity's registry.
class QuantityFormatter {
public:
    explicit QuantityFormatter(OutputTemplate output = OutputTemplate::PLAIN);

    std::string format(const Quantity& quantity) const;

    // Base-unit symbols with their exponents, e.g. "kg·m·s⁻²". A lone
    // mass component is written "g" so that a prefix can complete it.
    std::string unit_string(const Dimensions& dims) const;

    // Registry symbol with prefix, in this template's markup.
    std::string format_symbol(const std::string& prefix, const std::string& symbol) const;

    // Empty for a power of 1.
    std::string format_exponent(int power) const;

    static std::string superscript(const std::string& text);
    static std::string format_value(double value, int precision);

private:
    std::string prefix_markup(const std::string& prefix) const;
    std::string wrap_exponent(const std::string& exponent) const;

    OutputTemplate output_;
};

} // namespace pqe::domain

#include "domain/resolution/QuantityFormatter.hpp"

#include "domain/resolution/UnitResolver.hpp"
#include "domain/value_objects/Quantity.hpp"

#include <array>
#include <iomanip>
#include <map>
#include <sstream>

namespace pqe::domain {

namespace {

constexpr std::array<const char*, Dimensions::kArity> kBaseSymbols = {
    "kg", "m", "s", "A", "cd", "K", "mol"};

constexpr const char* kLatexSymbolOpen = "\\mathrm{";

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

QuantityFormatter::QuantityFormatter(OutputTemplate output) : output_(output) {}

std::string QuantityFormatter::format(const Quantity& quantity) const {
    UnitResolver resolver(quantity.registry().get());
    auto resolution = resolver.resolve(quantity.dimensions(), quantity.factor());

    double magnitude = quantity.value() * quantity.factor();
    std::string prefix;
    if (resolution.prefix_eligible) {
        bool mass = UnitResolver::is_mass_basis(resolution.basis);
        prefix = quantity.prefix().empty()
            ? UnitResolver::auto_prefix(magnitude, resolution.power, mass)
            : quantity.prefix();
        magnitude = UnitResolver::prefixed_value(magnitude, resolution.power, prefix, mass);
    }

    std::string units;
    std::string exponent;
    if (resolution.composite()) {
        // Composite symbols carry their own exponents.
        units = unit_string(quantity.dimensions());
        if (!prefix.empty()) {
            if (output_ == OutputTemplate::LATEX) {
                units.insert(std::string(kLatexSymbolOpen).size(), prefix_markup(prefix));
            } else {
                units = prefix_markup(prefix) + units;
            }
        }
    } else {
        units = format_symbol(prefix, resolution.symbol);
        exponent = format_exponent(resolution.power);
    }

    std::string separator = " ";
    if (output_ == OutputTemplate::HTML) {
        separator = "&nbsp;";
    } else if (output_ == OutputTemplate::LATEX) {
        separator = "\\ ";
    }

    std::string out = format_value(magnitude, quantity.precision());
    if (!units.empty()) {
        out += separator + units + exponent;
    }
    return out;
}

std::string QuantityFormatter::unit_string(const Dimensions& dims) const {
    std::string dot = "·";
    if (output_ == OutputTemplate::HTML) {
        dot = "&#8901;";
    } else if (output_ == OutputTemplate::LATEX) {
        dot = " \\cdot ";
    }

    bool mass_only = dims.nonzero_count() == 1 && dims[0].numerator() != 0 &&
                     dims[0].denominator() == 1;

    std::string out;
    for (std::size_t i = 0; i < Dimensions::kArity; ++i) {
        const auto& exponent = dims[i];
        if (exponent.numerator() == 0) continue;

        std::string symbol = (i == 0 && mass_only) ? "g" : kBaseSymbols[i];
        if (output_ == OutputTemplate::LATEX) {
            symbol = kLatexSymbolOpen + symbol + "}";
        }
        if (exponent != Exponent(1)) {
            symbol += wrap_exponent(exponent_to_string(exponent));
        }

        if (!out.empty()) out += dot;
        out += symbol;
    }
    return out;
}

std::string QuantityFormatter::format_symbol(const std::string& prefix,
                                             const std::string& symbol) const {
    switch (output_) {
    case OutputTemplate::HTML: {
        auto marked = replace_all(replace_all(symbol, "·", "&#8901;"), "*", "&#8901;");
        return prefix_markup(prefix) + replace_all(marked, "Ω", "&#0937;");
    }
    case OutputTemplate::LATEX: {
        std::string dot = "} \\cdot " + std::string(kLatexSymbolOpen);
        auto marked = replace_all(replace_all(symbol, "·", dot), "*", dot);
        marked = replace_all(marked, "Ω", "\\Omega");
        return kLatexSymbolOpen + prefix_markup(prefix) + marked + "}";
    }
    case OutputTemplate::PLAIN:
    default:
        return prefix + replace_all(symbol, "*", "·");
    }
}

std::string QuantityFormatter::format_exponent(int power) const {
    if (power == 1) return "";
    return wrap_exponent(std::to_string(power));
}

std::string QuantityFormatter::superscript(const std::string& text) {
    static const std::map<char, std::string> glyphs = {
        {'0', "⁰"}, {'1', "¹"}, {'2', "²"}, {'3', "³"}, {'4', "⁴"},
        {'5', "⁵"}, {'6', "⁶"}, {'7', "⁷"}, {'8', "⁸"}, {'9', "⁹"},
        {'-', "⁻"}, {'/', "ᐟ"}, {'.', "·"},
    };
    std::string out;
    for (char c : text) {
        auto it = glyphs.find(c);
        out += it != glyphs.end() ? it->second : std::string(1, c);
    }
    return out;
}

std::string QuantityFormatter::format_value(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string QuantityFormatter::prefix_markup(const std::string& prefix) const {
    if (prefix == "μ") {
        if (output_ == OutputTemplate::HTML) return "&mu;";
        if (output_ == OutputTemplate::LATEX) return "\\mu ";
    }
    return prefix;
}

std::string QuantityFormatter::wrap_exponent(const std::string& exponent) const {
    switch (output_) {
    case OutputTemplate::HTML:
        return "<sup>" + exponent + "</sup>";
    case OutputTemplate::LATEX:
        return "^{" + exponent + "}";
    case OutputTemplate::PLAIN:
    default:
        return superscript(exponent);
    }
}

} // namespace pqe::domain

#include "domain/resolution/QuantityFormatter.hpp"
#include "domain/value_objects/Quantity.hpp"

#include "support/SyntheticRegistry.hpp"

#include <gtest/gtest.h>

using namespace pqe::domain;
using namespace pqe::test_support;

class QuantityFormatterTest : public ::testing::Test {
protected:
    Quantity::RegistryPtr registry = make_registry();

    QuantityFormatter plain{OutputTemplate::PLAIN};
    QuantityFormatter html{OutputTemplate::HTML};
    QuantityFormatter latex{OutputTemplate::LATEX};

    Quantity q(double value, const Dimensions& dims, double factor = 1.0) const {
        return Quantity(value, dims, factor, Quantity::kDefaultPrecision, "", registry);
    }
};

// --- Building blocks ---

TEST(QuantityFormatterStatic, Superscript) {
    EXPECT_EQ(QuantityFormatter::superscript("2"), "²");
    EXPECT_EQ(QuantityFormatter::superscript("-2"), "⁻²");
    EXPECT_EQ(QuantityFormatter::superscript("10"), "¹⁰");
    EXPECT_EQ(QuantityFormatter::superscript("1/2"), "¹ᐟ²");
}

TEST(QuantityFormatterStatic, FormatValueUsesFixedDecimals) {
    EXPECT_EQ(QuantityFormatter::format_value(1.23456, 2), "1.23");
    EXPECT_EQ(QuantityFormatter::format_value(5.0, 3), "5.000");
    EXPECT_EQ(QuantityFormatter::format_value(5.0, 0), "5");
    EXPECT_EQ(QuantityFormatter::format_value(-0.5, 1), "-0.5");
}

TEST_F(QuantityFormatterTest, FormatExponent) {
    EXPECT_EQ(plain.format_exponent(1), "");
    EXPECT_EQ(plain.format_exponent(3), "³");
    EXPECT_EQ(html.format_exponent(3), "<sup>3</sup>");
    EXPECT_EQ(latex.format_exponent(-2), "^{-2}");
}

TEST_F(QuantityFormatterTest, UnitString) {
    EXPECT_EQ(plain.unit_string(force()), "kg·m·s⁻²");
    EXPECT_EQ(html.unit_string(Dimensions(0, 1, -1, 0, 0, 0, 0)), "m&#8901;s<sup>-1</sup>");
    EXPECT_EQ(latex.unit_string(Dimensions(0, 1, -1, 0, 0, 0, 0)),
              "\\mathrm{m} \\cdot \\mathrm{s}^{-1}");
    EXPECT_EQ(plain.unit_string(Dimensions(0, 0, 0, 0, 1, 1, 1)), "cd·K·mol");
    EXPECT_EQ(plain.unit_string(Dimensions::zero()), "");
}

TEST_F(QuantityFormatterTest, LoneMassIsWrittenInGrams) {
    EXPECT_EQ(plain.unit_string(mass()), "g");
    EXPECT_EQ(plain.unit_string(Dimensions(2, 0, 0, 0, 0, 0, 0)), "g²");
    EXPECT_EQ(plain.unit_string(Dimensions(1, 1, 0, 0, 0, 0, 0)), "kg·m");
}

TEST_F(QuantityFormatterTest, FormatSymbol) {
    EXPECT_EQ(plain.format_symbol("k", "N"), "kN");
    EXPECT_EQ(html.format_symbol("k", "Ω"), "k&#0937;");
    EXPECT_EQ(html.format_symbol("μ", "m"), "&mu;m");
    EXPECT_EQ(latex.format_symbol("", "Ω"), "\\mathrm{\\Omega}");
    EXPECT_EQ(latex.format_symbol("μ", "m"), "\\mathrm{\\mu m}");
    EXPECT_EQ(html.format_symbol("", "kip·ft"), "kip&#8901;ft");
    EXPECT_EQ(latex.format_symbol("", "kip·ft"), "\\mathrm{kip} \\cdot \\mathrm{ft}");
}

// --- Whole quantities ---

TEST_F(QuantityFormatterTest, PlainTemplate) {
    EXPECT_EQ(plain.format(q(5000.0, force())), "5.000 kN");
    EXPECT_EQ(plain.format(q(1.0, area(), kFootFactor * kFootFactor)), "10.764 ft²");
}

TEST_F(QuantityFormatterTest, HtmlTemplate) {
    EXPECT_EQ(html.format(q(5000.0, force())), "5.000&nbsp;kN");
    EXPECT_EQ(html.format(q(1.0, resistance())), "1.000&nbsp;&#0937;");
    EXPECT_EQ(html.format(q(1.0, area())), "1.000&nbsp;m<sup>2</sup>");
    EXPECT_EQ(html.format(q(1.0, area(), kFootFactor * kFootFactor)), "10.764&nbsp;ft<sup>2</sup>");
    EXPECT_EQ(html.format(q(2e-6, length())), "2.000&nbsp;&mu;m");
    EXPECT_EQ(html.format(q(1.0, Dimensions(1, 1, 0, 0, 0, 0, 0))), "1.000&nbsp;kg&#8901;m");
}

TEST_F(QuantityFormatterTest, LatexTemplate) {
    EXPECT_EQ(latex.format(q(5000.0, force())), "5.000\\ \\mathrm{kN}");
    EXPECT_EQ(latex.format(q(1.0, resistance())), "1.000\\ \\mathrm{\\Omega}");
    EXPECT_EQ(latex.format(q(1.0, area(), kFootFactor * kFootFactor)),
              "10.764\\ \\mathrm{ft}^{2}");
    EXPECT_EQ(latex.format(q(2e-6, length())), "2.000\\ \\mathrm{\\mu m}");
    EXPECT_EQ(latex.format(q(1500.0, length())), "1.500\\ \\mathrm{km}");
    EXPECT_EQ(latex.format(q(1.0, Dimensions(1, 1, 0, 0, 0, 0, 0))),
              "1.000\\ \\mathrm{kg} \\cdot \\mathrm{m}");
}

TEST_F(QuantityFormatterTest, QuantityRenderingMethodsMatchFormatter) {
    auto value = q(4700.0, resistance());
    EXPECT_EQ(value.str(), plain.format(value));
    EXPECT_EQ(value.html(), html.format(value));
    EXPECT_EQ(value.latex(), latex.format(value));
}

TEST_F(QuantityFormatterTest, WithoutRegistryEverythingIsComposite) {
    Quantity bare(5000.0, force());
    EXPECT_EQ(plain.format(bare), "5000.000 kg·m·s⁻²");
    EXPECT_EQ(plain.format(Quantity(1500.0, length())), "1.500 km");
}

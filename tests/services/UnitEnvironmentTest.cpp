#include "services/UnitEnvironment.hpp"
#include "domain/value_objects/Value.hpp"

#include "support/SyntheticRegistry.hpp"

#include <gtest/gtest.h>

using namespace pqe::domain;
using namespace pqe::test_support;
using pqe::services::UnitEnvironment;

class UnitEnvironmentTest : public ::testing::Test {
protected:
    UnitEnvironment environment{make_registry()};
};

TEST_F(UnitEnvironmentTest, ProvidesBaseUnitsInDimensionOrder) {
    const auto& bases = environment.base_units();
    ASSERT_EQ(bases.size(), 7u);
    EXPECT_EQ(bases[0].first, "kg");
    EXPECT_EQ(bases[1].first, "m");
    EXPECT_EQ(bases[6].first, "mol");
    for (std::size_t i = 0; i < bases.size(); ++i) {
        EXPECT_EQ(bases[i].second.dimensions(), Dimensions::basis(i));
        EXPECT_DOUBLE_EQ(bases[i].second.value(), 1.0);
    }
}

TEST_F(UnitEnvironmentTest, BaseUnitsRender) {
    EXPECT_EQ(environment.base("kg").str(), "1.000 kg");
    EXPECT_EQ(environment.base("m").str(), "1.000 m");
    EXPECT_EQ(environment.base("K").str(), "1.000 K");
    EXPECT_EQ(environment.base("s").str(), "1.000 s");
    EXPECT_EQ((environment.base("s") * 5.0).str(), "5.000 s");
    EXPECT_EQ((Value(environment.base("s")) * environment.base("s")).str(), "1.000 s²");
    EXPECT_THROW(environment.base("lb"), UnknownUnit);
}

TEST_F(UnitEnvironmentTest, BaseUnitsComposeThroughRegistry) {
    auto kg = environment.base("kg");
    auto m = environment.base("m");
    auto s = environment.base("s");
    Value newton = Value(kg) * m / (s * s);
    EXPECT_EQ(newton.str(), "1.000 N");
}

TEST_F(UnitEnvironmentTest, NamedUnitsDisplayAsOne) {
    EXPECT_EQ(environment.unit("N").str(), "1.000 N");
    EXPECT_EQ(environment.unit("lb").str(), "1.000 lb");
    EXPECT_EQ(environment.unit("ft").str(), "1.000 ft");
    EXPECT_THROW(environment.unit("furlong"), UnknownUnit);
}

TEST_F(UnitEnvironmentTest, DefinedUnitCarriesSiMagnitude) {
    auto foot = environment.unit("ft");
    EXPECT_NEAR(foot.value(), 0.3048, 1e-12);
    EXPECT_EQ(foot.si().str(), "304.800 mm");
}

TEST_F(UnitEnvironmentTest, ArithmeticWithNamedUnits) {
    auto ten_feet = environment.unit("ft") * 10.0;
    EXPECT_EQ(ten_feet.str(), "10.000 ft");
    auto total = ten_feet + environment.unit("ft");
    EXPECT_EQ(total.str(), "11.000 ft");
}

TEST_F(UnitEnvironmentTest, ListsEveryUnit) {
    auto units = environment.units();
    EXPECT_EQ(units.size(), environment.registry()->size());
    ASSERT_TRUE(units.count("ha"));
    EXPECT_EQ(units.at("ha").str(), "1.000 ha");
}

TEST(UnitEnvironment, PrecisionPropagates) {
    UnitEnvironment environment(make_registry(), 1);
    EXPECT_EQ(environment.precision(), 1);
    EXPECT_EQ(environment.unit("N").str(), "1.0 N");
    EXPECT_EQ(environment.base("kg").str(), "1.0 kg");
}

TEST(UnitEnvironment, RequiresRegistry) {
    EXPECT_THROW(UnitEnvironment(nullptr), std::invalid_argument);
}

#include <gtest/gtest.h>
#include <tsnorm/decimal.hpp>

using namespace tsnorm;

class DecimalTest : public ::testing::Test {
protected:
    // 1281643591.4298760 seconds in 100 ns units
    static constexpr int64_t ticks = 12'816'435'914'298'760;
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(DecimalTest, DefaultIsZero) {
    Decimal d;
    EXPECT_TRUE(d.is_zero());
    EXPECT_FALSE(d.is_negative());
    EXPECT_EQ(d.scale(), 0);
    EXPECT_EQ(d.to_string(), "0");
}

TEST_F(DecimalTest, FromWholeNumber) {
    Decimal d(1'281'643'591);
    EXPECT_EQ(d.scale(), 0);
    EXPECT_EQ(static_cast<int64_t>(d.units()), 1'281'643'591);
    EXPECT_EQ(d.to_string(), "1281643591");
}

TEST_F(DecimalTest, FromUnitsKeepsScale) {
    auto d = Decimal::from_units<7>(ticks);
    EXPECT_EQ(d.scale(), 7);
    EXPECT_EQ(static_cast<int64_t>(d.units()), ticks);
}

TEST_F(DecimalTest, FromUnitsScaleIsCompileTime) {
    constexpr auto finest = Decimal::from_units<Decimal::max_scale>(5);
    static_assert(finest.scale() == Decimal::max_scale);
    static_assert(Decimal::from_units<0>(5) == Decimal(5));
    EXPECT_EQ(finest.to_string(), "0.000000000000000005");
}

// ==============================================================================
// String Rendering
// ==============================================================================

TEST_F(DecimalTest, ToStringStripsTrailingZeros) {
    EXPECT_EQ(Decimal::from_units<7>(ticks).to_string(), "1281643591.429876");
    EXPECT_EQ(Decimal::from_units<7>(12'816'435'910'000'000).to_string(), "1281643591");
    EXPECT_EQ(Decimal::from_units<1>(12'816'363'916).to_string(), "1281636391.6");
}

TEST_F(DecimalTest, ToStringNegative) {
    EXPECT_EQ(Decimal::from_units<1>(-5).to_string(), "-0.5");
    EXPECT_EQ(Decimal(-1).to_string(), "-1");
    EXPECT_EQ(Decimal::from_units<3>(-1'500).to_string(), "-1.5");
}

TEST_F(DecimalTest, ToStringLeadingFractionZeros) {
    EXPECT_EQ(Decimal::from_units<9>(1).to_string(), "0.000000001");
    EXPECT_EQ(Decimal::from_units<9>(1'000'000'001).to_string(), "1.000000001");
}

// ==============================================================================
// Rounding
// ==============================================================================

TEST_F(DecimalTest, FloorPositive) {
    EXPECT_EQ(static_cast<int64_t>(Decimal::from_units<7>(ticks).floor()), 1'281'643'591);
}

TEST_F(DecimalTest, FloorNegativeRoundsDown) {
    EXPECT_EQ(static_cast<int64_t>(Decimal::from_units<1>(-5).floor()), -1);
    EXPECT_EQ(static_cast<int64_t>(Decimal::from_units<1>(-10).floor()), -1);
}

TEST_F(DecimalTest, RescaledToMicroseconds) {
    auto d = Decimal::from_units<7>(ticks);
    EXPECT_EQ(static_cast<int64_t>(d.rescaled(6)), 1'281'643'591'429'876);
    EXPECT_EQ(static_cast<int64_t>(Decimal(2).rescaled(6)), 2'000'000);
    EXPECT_EQ(static_cast<int64_t>(Decimal::from_units<7>(-1).rescaled(6)), -1);
}

// ==============================================================================
// Arithmetic and Comparison
// ==============================================================================

TEST_F(DecimalTest, ArithmeticIsExact) {
    auto d = Decimal::from_units<7>(ticks) - Decimal(62'135'596'800);
    EXPECT_EQ(d.to_string(), "-60853953208.570124");

    EXPECT_EQ(Decimal(1) - Decimal::from_units<1>(5), Decimal::from_units<1>(5));
    EXPECT_EQ(Decimal::from_units<1>(1) + Decimal::from_units<1>(2), Decimal::from_units<1>(3));
}

TEST_F(DecimalTest, CompoundAssignment) {
    Decimal d(10);
    d += Decimal::from_units<1>(25);
    EXPECT_EQ(d.to_string(), "12.5");
    d -= Decimal(20);
    EXPECT_EQ(d.to_string(), "-7.5");
    EXPECT_EQ((-d).to_string(), "7.5");
}

TEST_F(DecimalTest, EqualityIgnoresScale) {
    EXPECT_EQ(Decimal::from_units<1>(5), Decimal::from_units<2>(50));
    EXPECT_EQ(Decimal(3), Decimal::from_units<6>(3'000'000));
    EXPECT_NE(Decimal(3), Decimal::from_units<6>(3'000'001));
}

TEST_F(DecimalTest, Ordering) {
    EXPECT_LT(Decimal::from_units<1>(-5), Decimal(0));
    EXPECT_LT(Decimal(1), Decimal::from_units<6>(1'000'001));
    EXPECT_GT(Decimal::from_units<7>(ticks), Decimal(1'281'643'591));
    EXPECT_LE(Decimal(7), Decimal::from_units<1>(70));
}

TEST_F(DecimalTest, ToDouble) {
    EXPECT_DOUBLE_EQ(Decimal::from_units<1>(25).to_double(), 2.5);
    EXPECT_DOUBLE_EQ(Decimal::from_units<1>(-5).to_double(), -0.5);
}

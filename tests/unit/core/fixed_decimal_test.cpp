#include <gtest/gtest.h>

#include "humidor/core/fixed_decimal.h"

namespace humidor {

TEST(FixedDecimalTest, ToScaledSupportsHalfUpDownAndUp) {
    EXPECT_EQ(FixedDecimal::ToScaled(6.864L, 2, FixedRoundingMode::kHalfUp), 686);
    EXPECT_EQ(FixedDecimal::ToScaled(6.865L, 2, FixedRoundingMode::kHalfUp), 687);
    EXPECT_EQ(FixedDecimal::ToScaled(6.869L, 2, FixedRoundingMode::kDown), 686);
    EXPECT_EQ(FixedDecimal::ToScaled(6.861L, 2, FixedRoundingMode::kUp), 687);
    EXPECT_EQ(FixedDecimal::ToScaled(-1.235L, 2, FixedRoundingMode::kHalfUp), -124);
}

TEST(FixedDecimalTest, RoundMoneyAbsorbsBinaryNoise) {
    EXPECT_DOUBLE_EQ(FixedDecimal::RoundMoney(6.86 * 3.0), 20.58);
    EXPECT_DOUBLE_EQ(FixedDecimal::RoundMoney(5.43 + 1.43), 6.86);
    EXPECT_DOUBLE_EQ(FixedDecimal::RoundMoney(0.005), 0.01);
}

TEST(FixedDecimalTest, FormatMoneyPadsCentsAndKeepsSign) {
    EXPECT_EQ(FixedDecimal::FormatMoney(20.58), "$20.58");
    EXPECT_EQ(FixedDecimal::FormatMoney(5.0), "$5.00");
    EXPECT_EQ(FixedDecimal::FormatMoney(0.4), "$0.40");
    EXPECT_EQ(FixedDecimal::FormatMoney(-3.057), "-$3.06");
}

TEST(FixedDecimalTest, FromScaledRestoresScaledValue) {
    EXPECT_NEAR(static_cast<double>(FixedDecimal::FromScaled(2058, 2)), 20.58, 1e-9);
}

}  // namespace humidor

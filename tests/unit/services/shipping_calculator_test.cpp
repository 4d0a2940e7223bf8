#include <gtest/gtest.h>

#include "humidor/services/shipping_calculator.h"

namespace humidor {

TEST(ShippingCalculatorTest, SplitsShippingPerUnitAndPerPack) {
    const auto quote = ShippingCalculator::Quote(25.0, 20);
    EXPECT_DOUBLE_EQ(quote.per_unit, 1.25);
    EXPECT_DOUBLE_EQ(quote.five_pack, 5.0);
    EXPECT_DOUBLE_EQ(quote.ten_pack, 2.5);
}

TEST(ShippingCalculatorTest, WithoutUnitsTheWholeChargeIsPerUnit) {
    const auto quote = ShippingCalculator::Quote(12.0, 0);
    EXPECT_DOUBLE_EQ(quote.per_unit, 12.0);
    EXPECT_DOUBLE_EQ(ShippingCalculator::Quote(12.0, -4).per_unit, 12.0);
    EXPECT_DOUBLE_EQ(quote.five_pack, 2.4);
}

}  // namespace humidor

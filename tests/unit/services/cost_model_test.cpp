#include <gtest/gtest.h>

#include <limits>

#include "humidor/services/cost_model.h"

namespace humidor {

TEST(CostModelTest, SpreadsTaxedPriceAndShippingOverCount) {
    const CostModel model(0.086);
    const auto result = model.Evaluate(50.0, 14.30, 10);
    EXPECT_EQ(result.status, CostStatus::kComputed);
    EXPECT_NEAR(result.unit_cost, 6.86, 1e-9);
}

TEST(CostModelTest, ShippingUsesOriginalQuantityWhenPresent) {
    const CostModel model(0.086);
    const double expected = 50.0 / 7.0 * 1.086 + 14.30 / 10.0;
    EXPECT_NEAR(model.ComputeUnitCost(50.0, 14.30, 7, 10), expected, 1e-9);
    // A zero original quantity falls back to the current count.
    EXPECT_NEAR(model.ComputeUnitCost(50.0, 14.30, 10, 0), 6.86, 1e-9);
}

TEST(CostModelTest, EmptyLotHasZeroUnitCost) {
    const CostModel model;
    const auto result = model.Evaluate(50.0, 10.0, 0, 10);
    EXPECT_EQ(result.status, CostStatus::kEmptyLot);
    EXPECT_TRUE(result.valid());
    EXPECT_DOUBLE_EQ(result.unit_cost, 0.0);
}

TEST(CostModelTest, RejectsNegativeOrNonFiniteInputs) {
    const CostModel model;
    EXPECT_EQ(model.Evaluate(-1.0, 0.0, 5).status, CostStatus::kInvalidInput);
    EXPECT_EQ(model.Evaluate(1.0, -0.5, 5).status, CostStatus::kInvalidInput);
    EXPECT_EQ(model.Evaluate(std::numeric_limits<double>::quiet_NaN(), 0.0, 5).status,
              CostStatus::kInvalidInput);
    EXPECT_FALSE(model.Evaluate(1.0, std::numeric_limits<double>::infinity(), 5).valid());
    EXPECT_DOUBLE_EQ(model.ComputeUnitCost(-1.0, 0.0, 5), 0.0);
}

TEST(CostModelTest, EvaluatesEditFieldText) {
    const CostModel model(0.086);
    const auto result = model.EvaluateText("$50", " 14.30", "10");
    ASSERT_TRUE(result.valid());
    EXPECT_NEAR(result.unit_cost, 6.86, 1e-9);

    EXPECT_EQ(model.EvaluateText("fifty", "0", "10").status, CostStatus::kInvalidInput);
    EXPECT_EQ(model.EvaluateText("50", "0", "2.5").status, CostStatus::kInvalidInput);
    EXPECT_EQ(model.EvaluateText("50", "0", "10", "x").status, CostStatus::kInvalidInput);
}

TEST(CostModelTest, RecomputeWritesLotUnitCost) {
    const CostModel model(0.086);
    Lot lot;
    lot.count = 10;
    lot.price = 50.0;
    lot.allocated_shipping = 10.0;
    lot.allocated_tax = 4.30;
    lot.original_quantity = 10;

    const auto result = model.Recompute(&lot);
    EXPECT_EQ(result.status, CostStatus::kComputed);
    EXPECT_NEAR(lot.unit_cost, 6.86, 1e-9);
    EXPECT_FALSE(model.Recompute(nullptr).valid());
}

TEST(CostModelTest, TaxRateAcceptsFractionOrPercent) {
    CostModel model;
    EXPECT_DOUBLE_EQ(model.tax_rate(), kDefaultTaxRate);

    ASSERT_TRUE(model.SetTaxRate(7.5));
    EXPECT_DOUBLE_EQ(model.tax_rate(), 0.075);
    ASSERT_TRUE(model.SetTaxRate(0.1));
    EXPECT_DOUBLE_EQ(model.tax_rate(), 0.1);

    EXPECT_FALSE(model.SetTaxRate(-0.01));
    EXPECT_FALSE(model.SetTaxRate(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_DOUBLE_EQ(model.tax_rate(), 0.1);
}

TEST(CostModelTest, InvalidConstructorRateFallsBackToDefault) {
    const CostModel model(-3.0);
    EXPECT_DOUBLE_EQ(model.tax_rate(), kDefaultTaxRate);
}

TEST(CostModelTest, ZeroTaxLeavesBasePriceUntouched) {
    const CostModel model(0.0);
    EXPECT_NEAR(model.ComputeUnitCost(30.0, 6.0, 3), 12.0, 1e-12);
}

}  // namespace humidor

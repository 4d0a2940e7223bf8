#include <gtest/gtest.h>

#include "humidor/services/valuation_aggregator.h"

namespace humidor {
namespace {

LotDraft MakeDraft(const std::string& name, std::int32_t count, double price, double shipping) {
    LotDraft draft;
    draft.brand = "Padron";
    draft.name = name;
    draft.size = "5x50";
    draft.count = count;
    draft.price = price;
    draft.shipping = shipping;
    return draft;
}

}  // namespace

TEST(ValuationAggregatorTest, EmptyStoreAggregatesToZero) {
    LotStore lots;
    const ValuationAggregator aggregator(&lots);
    const auto summary = aggregator.Aggregate();
    EXPECT_EQ(summary.total_count, 0);
    EXPECT_DOUBLE_EQ(summary.total_value, 0.0);
    EXPECT_DOUBLE_EQ(summary.average_shipping, 0.0);
    EXPECT_DOUBLE_EQ(summary.average_unit_cost, 0.0);
    EXPECT_EQ(summary.stocked_lots, 0U);

    const ValuationAggregator detached(nullptr);
    EXPECT_EQ(detached.TotalCount(), 0);
    EXPECT_DOUBLE_EQ(detached.TotalValue(), 0.0);
}

TEST(ValuationAggregatorTest, SumsStockedLotsAndSkipsEmptyOnes) {
    const CostModel model(0.0);
    LotStore lots;
    lots.AddLot(MakeDraft("1964", 10, 50.0, 10.0), model);
    lots.AddLot(MakeDraft("1926", 5, 50.0, 5.0), model);
    lots.AddLot(MakeDraft("2000", 0, 90.0, 30.0), model);

    const ValuationAggregator aggregator(&lots);
    EXPECT_EQ(aggregator.TotalCount(), 15);
    // 10 x 6.00 + 5 x 11.00
    EXPECT_NEAR(aggregator.TotalValue(), 115.0, 1e-9);
    EXPECT_NEAR(aggregator.AverageShipping(), 7.5, 1e-9);
    EXPECT_NEAR(aggregator.AverageUnitCost(), 115.0 / 15.0, 1e-9);

    const auto summary = aggregator.Aggregate();
    EXPECT_EQ(summary.stocked_lots, 2U);
    EXPECT_NEAR(summary.average_unit_cost, aggregator.AverageUnitCost(), 1e-12);
}

TEST(ValuationAggregatorTest, PriceSelectionUsesCurrentUnitCost) {
    const CostModel model(0.0);
    LotStore lots;
    const auto id = lots.AddLot(MakeDraft("1964", 10, 50.0, 10.0), model);

    const ValuationAggregator aggregator(&lots);
    const auto total =
        aggregator.PriceSelection({SaleItem{id, 3}, SaleItem{id, 0}, SaleItem{"lot-000404", 2}});
    // The zero quantity counts as one unit; the unknown lot costs nothing.
    EXPECT_NEAR(total.total_price, 24.0, 1e-9);
    EXPECT_EQ(total.total_units, 6);
}

}  // namespace humidor

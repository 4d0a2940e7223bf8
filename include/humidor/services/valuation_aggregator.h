#pragma once

#include <cstdint>
#include <vector>

#include "humidor/contracts/types.h"
#include "humidor/services/lot_store.h"

namespace humidor {

struct ValuationSummary {
    std::int64_t total_count{0};
    double total_value{0.0};
    double average_shipping{0.0};
    double average_unit_cost{0.0};
    std::size_t stocked_lots{0};
};

struct SelectionTotal {
    double total_price{0.0};
    std::int64_t total_units{0};
};

// Read-only roll-ups over the current lots. Only lots with stock contribute
// to value and shipping averages.
class ValuationAggregator {
public:
    explicit ValuationAggregator(const LotStore* lots);

    std::int64_t TotalCount() const;
    double TotalValue() const;
    double AverageShipping() const;
    double AverageUnitCost() const;
    ValuationSummary Aggregate() const;

    // Prices a prospective sale at current unit costs. Unknown lots count as
    // one unit at zero cost and quantities below one count as one.
    SelectionTotal PriceSelection(const std::vector<SaleItem>& items) const;

private:
    const LotStore* lots_;
};

}  // namespace humidor

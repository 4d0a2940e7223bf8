#include "humidor/services/valuation_aggregator.h"

namespace humidor {

ValuationAggregator::ValuationAggregator(const LotStore* lots) : lots_(lots) {}

std::int64_t ValuationAggregator::TotalCount() const {
    if (lots_ == nullptr) {
        return 0;
    }
    std::int64_t total = 0;
    for (const auto& lot : lots_->lots()) {
        total += lot.count;
    }
    return total;
}

double ValuationAggregator::TotalValue() const {
    if (lots_ == nullptr) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& lot : lots_->lots()) {
        if (lot.count > 0) {
            total += lot.unit_cost * static_cast<double>(lot.count);
        }
    }
    return total;
}

double ValuationAggregator::AverageShipping() const {
    if (lots_ == nullptr) {
        return 0.0;
    }
    double sum = 0.0;
    std::size_t stocked = 0;
    for (const auto& lot : lots_->lots()) {
        if (lot.count > 0) {
            sum += lot.shipping();
            ++stocked;
        }
    }
    return stocked == 0 ? 0.0 : sum / static_cast<double>(stocked);
}

double ValuationAggregator::AverageUnitCost() const {
    const auto count = TotalCount();
    return count > 0 ? TotalValue() / static_cast<double>(count) : 0.0;
}

ValuationSummary ValuationAggregator::Aggregate() const {
    ValuationSummary summary;
    summary.total_count = TotalCount();
    summary.total_value = TotalValue();
    summary.average_shipping = AverageShipping();
    summary.average_unit_cost =
        summary.total_count > 0 ? summary.total_value / static_cast<double>(summary.total_count)
                                : 0.0;
    if (lots_ != nullptr) {
        for (const auto& lot : lots_->lots()) {
            if (lot.count > 0) {
                ++summary.stocked_lots;
            }
        }
    }
    return summary;
}

SelectionTotal ValuationAggregator::PriceSelection(const std::vector<SaleItem>& items) const {
    SelectionTotal total;
    for (const auto& item : items) {
        const std::int32_t quantity = item.quantity < 1 ? 1 : item.quantity;
        const Lot* lot = lots_ == nullptr ? nullptr : lots_->Find(item.lot_id);
        const double unit_cost = lot == nullptr ? 0.0 : lot->unit_cost;
        total.total_price += unit_cost * static_cast<double>(quantity);
        total.total_units += quantity;
    }
    return total;
}

}  // namespace humidor

#include "humidor/services/cost_model.h"

#include <cmath>

#include "humidor/core/numeric_input.h"

namespace humidor {
namespace {

bool IsNonNegativeFinite(double value) {
    return std::isfinite(value) && value >= 0.0;
}

}  // namespace

CostModel::CostModel(double tax_rate) {
    if (!SetTaxRate(tax_rate)) {
        tax_rate_ = kDefaultTaxRate;
    }
}

UnitCostResult CostModel::Evaluate(double price,
                                   double shipping,
                                   std::int32_t count,
                                   std::optional<std::int32_t> original_quantity) const {
    UnitCostResult result;
    if (count <= 0) {
        result.status = CostStatus::kEmptyLot;
        return result;
    }
    if (!IsNonNegativeFinite(price) || !IsNonNegativeFinite(shipping)) {
        result.status = CostStatus::kInvalidInput;
        return result;
    }

    const auto per_unit_base = price / static_cast<double>(count);
    const auto with_tax = per_unit_base * (1.0 + tax_rate_);
    const std::int32_t shipping_quantity =
        original_quantity.has_value() && *original_quantity > 0 ? *original_quantity : count;
    const auto per_unit_shipping = shipping / static_cast<double>(shipping_quantity);

    result.unit_cost = with_tax + per_unit_shipping;
    return result;
}

UnitCostResult CostModel::EvaluateText(const std::string& price,
                                       const std::string& shipping,
                                       const std::string& count,
                                       const std::string& original_quantity) const {
    UnitCostResult invalid;
    invalid.status = CostStatus::kInvalidInput;

    double parsed_price = 0.0;
    double parsed_shipping = 0.0;
    std::int32_t parsed_count = 0;
    if (!ParseDecimalText(price, &parsed_price, nullptr) ||
        !ParseDecimalText(shipping, &parsed_shipping, nullptr) ||
        !ParseCountText(count, &parsed_count, nullptr)) {
        return invalid;
    }

    std::optional<std::int32_t> parsed_original;
    if (!original_quantity.empty()) {
        std::int32_t value = 0;
        if (!ParseCountText(original_quantity, &value, nullptr)) {
            return invalid;
        }
        parsed_original = value;
    }
    return Evaluate(parsed_price, parsed_shipping, parsed_count, parsed_original);
}

double CostModel::ComputeUnitCost(double price,
                                  double shipping,
                                  std::int32_t count,
                                  std::optional<std::int32_t> original_quantity) const {
    return Evaluate(price, shipping, count, original_quantity).unit_cost;
}

UnitCostResult CostModel::Recompute(Lot* lot) const {
    if (lot == nullptr) {
        UnitCostResult invalid;
        invalid.status = CostStatus::kInvalidInput;
        return invalid;
    }
    const auto result = Evaluate(lot->price, lot->shipping(), lot->count, lot->original_quantity);
    lot->unit_cost = result.unit_cost;
    return result;
}

bool CostModel::SetTaxRate(double tax_rate) {
    double normalized = 0.0;
    if (!NormalizeTaxRate(tax_rate, &normalized)) {
        return false;
    }
    tax_rate_ = normalized;
    return true;
}

double CostModel::tax_rate() const {
    return tax_rate_;
}

bool CostModel::NormalizeTaxRate(double value, double* rate) {
    if (rate == nullptr || !IsNonNegativeFinite(value)) {
        return false;
    }
    *rate = value > 1.0 ? value / 100.0 : value;
    return true;
}

}  // namespace humidor

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "humidor/contracts/types.h"

namespace humidor {

constexpr double kDefaultTaxRate = 0.086;

enum class CostStatus {
    kComputed,
    kEmptyLot,
    kInvalidInput,
};

struct UnitCostResult {
    double unit_cost{0.0};
    CostStatus status{CostStatus::kComputed};

    bool valid() const { return status != CostStatus::kInvalidInput; }
};

// Amortized per-unit cost of a lot. Base price and tax are spread over the
// remaining count; shipping is spread over the original purchase quantity so
// the remaining stock does not get dearer as units sell.
class CostModel {
public:
    explicit CostModel(double tax_rate = kDefaultTaxRate);

    UnitCostResult Evaluate(double price,
                            double shipping,
                            std::int32_t count,
                            std::optional<std::int32_t> original_quantity = std::nullopt) const;
    UnitCostResult EvaluateText(const std::string& price,
                                const std::string& shipping,
                                const std::string& count,
                                const std::string& original_quantity = "") const;

    double ComputeUnitCost(double price,
                           double shipping,
                           std::int32_t count,
                           std::optional<std::int32_t> original_quantity = std::nullopt) const;

    // Writes the recomputed value into lot->unit_cost.
    UnitCostResult Recompute(Lot* lot) const;

    bool SetTaxRate(double tax_rate);
    double tax_rate() const;

    // Accepts either a fraction (0.086) or a percent (8.6).
    static bool NormalizeTaxRate(double value, double* rate);

private:
    double tax_rate_{kDefaultTaxRate};
};

}  // namespace humidor

#include "humidor/services/shipping_calculator.h"

namespace humidor {

ShippingQuote ShippingCalculator::Quote(double shipping, std::int64_t total_units) {
    ShippingQuote quote;
    quote.per_unit = total_units > 0 ? shipping / static_cast<double>(total_units) : shipping;
    quote.five_pack = shipping / 5.0;
    quote.ten_pack = shipping / 10.0;
    return quote;
}

}  // namespace humidor

#pragma once

#include <cstdint>

namespace humidor {

struct ShippingQuote {
    double per_unit{0.0};
    double five_pack{0.0};
    double ten_pack{0.0};
};

class ShippingCalculator {
public:
    // With no units the whole shipping charge lands on a single stick.
    static ShippingQuote Quote(double shipping, std::int64_t total_units);
};

}  // namespace humidor

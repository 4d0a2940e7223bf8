#pragma once

#include <cstdint>
#include <string>

namespace humidor {

enum class FixedRoundingMode {
    kHalfUp = 0,
    kDown = 1,
    kUp = 2,
};

class FixedDecimal {
public:
    static constexpr int kMoneyScale = 2;

    static std::int64_t ToScaled(long double value, int scale, FixedRoundingMode mode);
    static long double FromScaled(std::int64_t scaled_value, int scale);

    // Cents, half away from zero.
    static double RoundMoney(double value);
    static std::string FormatMoney(double value);
};

}  // namespace humidor

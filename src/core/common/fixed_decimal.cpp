#include "humidor/core/fixed_decimal.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace humidor {
namespace {

long double ScaleFactor(int scale) {
    long double factor = 1.0L;
    for (int i = 0; i < std::min(scale, 18); ++i) {
        factor *= 10.0L;
    }
    return factor;
}

std::int64_t Saturate(long double value) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (!std::isfinite(static_cast<double>(value))) {
        return 0;
    }
    if (value >= static_cast<long double>(kMax)) {
        return kMax;
    }
    if (value <= static_cast<long double>(kMin)) {
        return kMin;
    }
    return static_cast<std::int64_t>(value);
}

}  // namespace

std::int64_t FixedDecimal::ToScaled(long double value, int scale, FixedRoundingMode mode) {
    const long double scaled = value * ScaleFactor(std::max(0, scale));
    switch (mode) {
        case FixedRoundingMode::kDown:
            return Saturate(std::floor(scaled));
        case FixedRoundingMode::kUp:
            return Saturate(std::ceil(scaled));
        case FixedRoundingMode::kHalfUp:
            break;
    }
    // The epsilon absorbs binary noise such as 20.58 stored as 20.579999...
    constexpr long double kNudge = 1e-9L;
    if (scaled >= 0) {
        return Saturate(std::floor(scaled + 0.5L + kNudge));
    }
    return Saturate(std::ceil(scaled - 0.5L - kNudge));
}

long double FixedDecimal::FromScaled(std::int64_t scaled_value, int scale) {
    return static_cast<long double>(scaled_value) / ScaleFactor(std::max(0, scale));
}

double FixedDecimal::RoundMoney(double value) {
    const auto cents = ToScaled(value, kMoneyScale, FixedRoundingMode::kHalfUp);
    return static_cast<double>(FromScaled(cents, kMoneyScale));
}

std::string FixedDecimal::FormatMoney(double value) {
    const auto cents = ToScaled(value, kMoneyScale, FixedRoundingMode::kHalfUp);
    const auto magnitude = cents < 0 ? -cents : cents;
    std::ostringstream oss;
    if (cents < 0) {
        oss << '-';
    }
    oss << '$' << magnitude / 100 << '.' << std::setw(2) << std::setfill('0') << magnitude % 100;
    return oss.str();
}

}  // namespace humidor

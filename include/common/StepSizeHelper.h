#pragma once
// ===================================================================
// Quantity step / price tick helpers for exchange order strings.
//
// Binance rejects quantities that are not a multiple of LOT_SIZE.stepSize
// and prices that are not a multiple of PRICE_FILTER.tickSize.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace gapswing {
namespace common {

// Number of decimals implied by a step such as 0.001 (-> 3).
inline int decimalsForStep(double step) {
    if (step <= 0.0) {
        return 8;
    }
    int decimals = 0;
    double t = step;
    while (t < 1.0 - 1e-12 && decimals < 8) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

inline double roundToDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

// Sizing always rounds down so the risked amount never exceeds the budget.
inline double floorToStep(double value, double step) {
    if (step <= 0.0) {
        return value;
    }
    const double units = std::floor(value / step + 1e-9);
    return roundToDecimals(units * step, decimalsForStep(step));
}

inline double roundToTick(double price, double tick) {
    if (tick <= 0.0) {
        return price;
    }
    return roundToDecimals(std::round(price / tick) * tick, decimalsForStep(tick));
}

inline std::string formatDecimal(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

inline std::string quantityToString(double quantity, double step) {
    return formatDecimal(floorToStep(quantity, step), decimalsForStep(step));
}

inline std::string priceToString(double price, double tick) {
    return formatDecimal(roundToTick(price, tick), decimalsForStep(tick));
}

} // namespace common
} // namespace gapswing

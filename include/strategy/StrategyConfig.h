#pragma once

namespace gapswing {
namespace strategy {

struct FvgStrategyConfig {
    // MACD
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;

    // Gap book
    int fvg_max_active = 3;
    int fvg_max_age_bars = 20;
    int fvg_retired_history = 10;

    // Stop placed beyond the far gap boundary by this fraction of its price.
    double stop_buffer_pct = 0.001;

    // Take-profit distance as a multiple of the stop distance.
    double reward_risk = 2.0;

    // Extra filter: histogram must have crossed zero in the gap direction recently.
    bool require_recent_crossover = false;
    int crossover_lookback = 6;
};

} // namespace strategy
} // namespace gapswing

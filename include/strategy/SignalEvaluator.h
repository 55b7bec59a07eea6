#pragma once

#include <optional>
#include <string>
#include <vector>
#include "analytics/FvgDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "strategy/Signal.h"
#include "strategy/StrategyConfig.h"

namespace gapswing {
namespace strategy {

struct Evaluation {
    std::optional<Signal> signal;
    std::vector<SignalRejection> rejections;
    size_t gaps_consumed = 0;           // gaps whose first touch happened on this bar
};

// Turns midpoint touches of active gaps into entry decisions.
class SignalEvaluator {
public:
    explicit SignalEvaluator(const FvgStrategyConfig& config);

    // Checks every active gap against the latest closed bar, newest gap first.
    // A touched gap is consumed whatever the outcome (fill_count = 1, status
    // filled). At most one signal is confirmed per bar; later touches in the
    // same bar are rejected as superseded. `histogram` is the tail-aligned
    // MACD histogram, only read when the crossover filter is enabled.
    Evaluation evaluate(const std::string& symbol,
                        std::vector<analytics::FairValueGap>& active_gaps,
                        const Candle& latest,
                        const analytics::TechnicalIndicators::MACDResult& macd,
                        bool has_open_position,
                        const std::vector<double>& histogram = {}) const;

    static bool touchesMidpoint(const analytics::FairValueGap& gap, const Candle& candle);
    static bool macdAgrees(Direction direction, const analytics::TechnicalIndicators::MACDResult& macd);

    // Histogram crossed zero in `direction` within the last `lookback` bars.
    // Too short a history passes.
    static bool hasRecentCrossover(Direction direction, const std::vector<double>& histogram, int lookback);

    double stopFor(const analytics::FairValueGap& gap) const;
    double takeProfitFor(Direction direction, double entry, double stop) const;

private:
    FvgStrategyConfig config_;
};

} // namespace strategy
} // namespace gapswing

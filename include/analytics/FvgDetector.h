#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "analytics/CandleSeries.h"

namespace gapswing {
namespace analytics {

enum class GapStatus { ACTIVE, FILLED, EXPIRED, EVICTED };

std::string gapStatusToString(GapStatus status);
GapStatus gapStatusFromString(const std::string& value);

// Three-candle price imbalance: the ranges of candles i-2 and i do not overlap.
struct FairValueGap {
    std::string id;
    std::string symbol;
    Direction direction;
    double top;
    double bottom;
    long long created_at;       // open_time of the third candle
    long long created_index;    // book bar counter when created
    GapStatus status;
    int fill_count;
    long long last_touch_time;  // open_time of the bar that touched the midpoint
    long long retired_at;       // open_time of the bar that retired the gap

    FairValueGap()
        : direction(Direction::BULLISH)
        , top(0.0)
        , bottom(0.0)
        , created_at(0)
        , created_index(0)
        , status(GapStatus::ACTIVE)
        , fill_count(0)
        , last_touch_time(0)
        , retired_at(0)
    {}

    double midpoint() const { return (top + bottom) / 2.0; }
    bool touchedBy(const Candle& candle) const {
        const double mid = midpoint();
        return candle.low <= mid && mid <= candle.high;
    }
};

// Per-symbol detector state. Owned by the engine state, passed in explicitly.
struct SymbolGapBook {
    std::vector<FairValueGap> active;
    std::vector<FairValueGap> retired;      // newest last, bounded
    long long last_bar_time = 0;            // newest bar the detector has processed
    long long bar_counter = 0;              // bars processed since the book was created
    long long last_evaluated_bar_time = 0;  // newest bar checked for midpoint touches
};

struct GapUpdate {
    size_t bars_processed = 0;
    size_t touched_unevaluated = 0;         // consumed on a bar before the newest
    std::vector<FairValueGap> created;
    std::vector<FairValueGap> retired;

    bool changed() const { return bars_processed > 0; }
};

class FvgDetector {
public:
    FvgDetector(int max_active = 3, int max_age_bars = 20, int retired_history = 10);

    // Walks every bar newer than book.last_bar_time in order. Per bar: retire
    // touched and aged gaps, detect a gap ending at the bar, evict the oldest
    // on overflow, and consume midpoint touches on every bar but the newest.
    // Re-feeding processed bars is a no-op. book.active holds the resulting
    // active set.
    GapUpdate update(const std::string& symbol, SymbolGapBook& book, const CandleSeries& series) const;

    // Gap formed by bars (i-2, i-1, i), if any.
    static std::optional<FairValueGap> detectAt(const std::string& symbol, const CandleSeries& series, size_t i);

    int maxActive() const { return max_active_; }
    int maxAgeBars() const { return max_age_bars_; }

private:
    void retire(SymbolGapBook& book, FairValueGap gap, GapStatus status,
                long long bar_time, GapUpdate& update) const;

    int max_active_;
    int max_age_bars_;
    int retired_history_;
};

} // namespace analytics
} // namespace gapswing

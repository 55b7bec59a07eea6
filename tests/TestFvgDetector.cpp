#include "analytics/FvgDetector.h"

#include <cassert>
#include <iostream>

using namespace gapswing;
using namespace gapswing::analytics;

namespace {
constexpr long long kT0 = 1699920000000LL;
constexpr long long kH4 = 4LL * 60 * 60 * 1000;

Candle bar(int index, double high, double low) {
    const double mid = (high + low) / 2.0;
    return Candle(mid, high, low, mid, 10.0, kT0 + index * kH4);
}

// Every bar from index 2 on leaves a bullish gap behind it.
std::vector<Candle> risingBars(int count) {
    std::vector<Candle> bars;
    for (int k = 0; k < count; ++k) {
        bars.push_back(bar(k, 105.0 + 10.0 * k, 100.0 + 10.0 * k));
    }
    return bars;
}

// Gap on bar 2, then `flat` bars that never form another one.
std::vector<Candle> gapThenFlat(int flat) {
    std::vector<Candle> bars = {bar(0, 100, 95), bar(1, 106, 99), bar(2, 110, 102)};
    for (int k = 0; k < flat; ++k) {
        bars.push_back(bar(3 + k, 112, 104));
    }
    return bars;
}
}

int main() {
    const FvgDetector detector(3, 20, 10);

    // Bullish gap
    {
        SymbolGapBook book;
        CandleSeries series(gapThenFlat(0));
        auto update = detector.update("BTCUSDT", book, series);
        assert(update.bars_processed == 3);
        assert(update.created.size() == 1);
        assert(book.active.size() == 1);
        const auto& gap = book.active.front();
        assert(gap.direction == Direction::BULLISH);
        assert(gap.top == 102 && gap.bottom == 100);
        assert(gap.top > gap.bottom);
        assert(gap.midpoint() == 101);
        assert(gap.created_at == kT0 + 2 * kH4);
        assert(gap.created_index == 3);
        assert(gap.status == GapStatus::ACTIVE && gap.fill_count == 0);
        assert(gap.id == "BTCUSDT-" + std::to_string(kT0 + 2 * kH4) + "-bullish");
        assert(book.last_bar_time == kT0 + 2 * kH4);

        // Re-feeding processed bars changes nothing.
        auto again = detector.update("BTCUSDT", book, series);
        assert(!again.changed());
        assert(again.created.empty());
        assert(book.active.size() == 1);
        assert(book.bar_counter == 3);
    }

    // Bearish mirror
    {
        SymbolGapBook book;
        CandleSeries series({bar(0, 110, 105), bar(1, 106, 99), bar(2, 103, 98)});
        detector.update("ETHUSDT", book, series);
        assert(book.active.size() == 1);
        const auto& gap = book.active.front();
        assert(gap.direction == Direction::BEARISH);
        assert(gap.top == 105 && gap.bottom == 103);
        assert(gap.id.find("-bearish") != std::string::npos);
    }

    // Ranges that touch exactly do not form a gap.
    {
        assert(!FvgDetector::detectAt("X", CandleSeries({bar(0, 100, 95), bar(1, 104, 99), bar(2, 105, 100)}), 2));
        assert(!FvgDetector::detectAt("X", CandleSeries({bar(0, 100, 95)}), 0));
    }

    // Overflow evicts the oldest
    {
        SymbolGapBook book;
        auto update = detector.update("BTCUSDT", book, CandleSeries(risingBars(6)));
        assert(update.created.size() == 4);
        assert(book.active.size() == 3);
        assert(book.retired.size() == 1);
        assert(book.retired.front().status == GapStatus::EVICTED);
        assert(book.retired.front().created_at == kT0 + 2 * kH4);
        for (const auto& gap : book.active) {
            assert(gap.created_at > kT0 + 2 * kH4);
        }
    }

    // Retired history is bounded
    {
        SymbolGapBook book;
        const FvgDetector short_history(3, 20, 2);
        short_history.update("BTCUSDT", book, CandleSeries(risingBars(10)));
        assert(book.active.size() == 3);
        assert(book.retired.size() == 2);
        assert(book.retired.back().created_at == kT0 + 6 * kH4);
    }

    // Expiry once the age exceeds 20 bars
    {
        SymbolGapBook book;
        detector.update("BTCUSDT", book, CandleSeries(gapThenFlat(20)));    // 23 bars, age 20
        assert(book.bar_counter == 23);
        assert(book.active.size() == 1);

        auto update = detector.update("BTCUSDT", book, CandleSeries(gapThenFlat(21)));
        assert(update.bars_processed == 1);
        assert(book.active.empty());
        assert(update.retired.size() == 1);
        assert(update.retired.front().status == GapStatus::EXPIRED);
        assert(update.retired.front().retired_at == kT0 + 23 * kH4);
    }

    // A touched gap leaves the active set on the next bar
    {
        SymbolGapBook book;
        detector.update("BTCUSDT", book, CandleSeries(gapThenFlat(1)));
        assert(book.active.size() == 1);
        book.active.front().fill_count = 1;
        book.active.front().status = GapStatus::FILLED;
        book.active.front().last_touch_time = kT0 + 3 * kH4;

        // Same bar again: still there.
        detector.update("BTCUSDT", book, CandleSeries(gapThenFlat(1)));
        assert(book.active.size() == 1);

        auto update = detector.update("BTCUSDT", book, CandleSeries(gapThenFlat(2)));
        assert(book.active.empty());
        assert(update.retired.size() == 1);
        assert(update.retired.front().status == GapStatus::FILLED);
        assert(book.retired.back().fill_count == 1);
    }

    // A midpoint crossed before the newest bar consumes and retires the gap
    {
        // Gap [100, 102] on bar 2, bar 3 trades through 101, bar 4 stays above.
        std::vector<Candle> bars = {bar(0, 100, 95), bar(1, 106, 99), bar(2, 110, 102),
                                    bar(3, 103, 100), bar(4, 112, 104)};

        SymbolGapBook batch;
        auto update = detector.update("BTCUSDT", batch, CandleSeries(bars));
        assert(update.bars_processed == 5);
        assert(update.touched_unevaluated == 1);
        assert(batch.active.empty());
        assert(update.retired.size() == 1);
        const auto& gap = batch.retired.back();
        assert(gap.status == GapStatus::FILLED);
        assert(gap.fill_count == 1);
        assert(gap.last_touch_time == kT0 + 3 * kH4);
        assert(gap.retired_at == kT0 + 4 * kH4);

        // The newest bar is not consumed by the detector.
        SymbolGapBook stepwise;
        auto partial = detector.update("BTCUSDT", stepwise,
                                       CandleSeries(std::vector<Candle>(bars.begin(), bars.begin() + 4)));
        assert(partial.touched_unevaluated == 0);
        assert(stepwise.active.size() == 1);
        assert(stepwise.active.front().fill_count == 0);

        // Consuming it on bar 3 one bar at a time ends in the same book.
        stepwise.active.front().fill_count = 1;
        stepwise.active.front().status = GapStatus::FILLED;
        stepwise.active.front().last_touch_time = kT0 + 3 * kH4;
        detector.update("BTCUSDT", stepwise, CandleSeries(bars));
        assert(stepwise.active.empty());
        assert(stepwise.retired.size() == 1);
        assert(stepwise.retired.back().id == gap.id);
        assert(stepwise.retired.back().retired_at == gap.retired_at);
        assert(stepwise.retired.back().last_touch_time == gap.last_touch_time);
        assert(stepwise.bar_counter == batch.bar_counter);

        // A later retouch finds nothing left to trade.
        bars.push_back(bar(5, 106, 100.5));
        detector.update("BTCUSDT", batch, CandleSeries(bars));
        assert(batch.active.empty());
    }

    // Resume from a saved book equals one uninterrupted pass
    {
        const auto bars = risingBars(8);
        SymbolGapBook straight;
        detector.update("BTCUSDT", straight, CandleSeries(bars));

        SymbolGapBook resumed;
        detector.update("BTCUSDT", resumed, CandleSeries(std::vector<Candle>(bars.begin(), bars.begin() + 5)));
        SymbolGapBook restored = resumed;       // what a restart would load
        detector.update("BTCUSDT", restored, CandleSeries(bars));

        assert(restored.bar_counter == straight.bar_counter);
        assert(restored.last_bar_time == straight.last_bar_time);
        assert(restored.active.size() == straight.active.size());
        for (size_t i = 0; i < straight.active.size(); ++i) {
            assert(restored.active[i].id == straight.active[i].id);
            assert(restored.active[i].created_index == straight.active[i].created_index);
        }
        assert(restored.retired.size() == straight.retired.size());
    }

    // Cold start on a long history only walks the age window but counts every bar
    {
        SymbolGapBook book;
        auto update = detector.update("BTCUSDT", book, CandleSeries(risingBars(50)));
        assert(book.bar_counter == 50);
        assert(update.bars_processed == 22);
        assert(book.active.size() == 3);
        assert(book.active.back().created_at == kT0 + 49 * kH4);
    }

    std::cout << "[TEST] FvgDetector PASSED\n";
    return 0;
}

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace gapswing {
namespace analytics {

// Ordered, de-duplicated sequence of closed candles for one symbol.
// Lookup only: the series never changes after construction.
class CandleSeries {
public:
    CandleSeries() = default;

    // Sorts ascending by open_time, keeps the last copy of a duplicated
    // open_time and drops malformed bars (non-finite values, high < low).
    explicit CandleSeries(std::vector<Candle> candles);

    // Same normalization, then drops the trailing bar if it has not closed by now_ms.
    static CandleSeries closedOnly(std::vector<Candle> candles, long long now_ms, long long timeframe_ms);

    // Binance kline rows: [openTime, "open", "high", "low", "close", "volume", closeTime, ...]
    static std::vector<Candle> klinesToCandles(const nlohmann::json& klines);

    // "15m", "4h", "1d" -> milliseconds. Throws std::invalid_argument otherwise.
    static long long timeframeToMs(const std::string& timeframe);

    size_t size() const { return candles_.size(); }
    bool empty() const { return candles_.empty(); }
    const Candle& at(size_t index) const { return candles_.at(index); }
    const Candle& back() const { return candles_.back(); }
    const std::vector<Candle>& candles() const { return candles_; }

    std::vector<double> closes() const;

    std::optional<size_t> indexOf(long long open_time) const;
    // Index of the first bar with open_time strictly greater than the argument.
    size_t firstAfter(long long open_time) const;

private:
    std::vector<Candle> candles_;
};

} // namespace analytics
} // namespace gapswing

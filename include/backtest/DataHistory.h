#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace gapswing {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: open_time,open,high,low,close,volume (header optional).
    // open_time in seconds is converted to milliseconds.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON file holding raw Binance kline rows.
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Timestamps below 1e11 are treated as seconds.
    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace gapswing

#pragma once

#include <cstddef>
#include <vector>

namespace gapswing {
namespace analytics {

// Technical indicators as pure functions of a price history (oldest first).
class TechnicalIndicators {
public:
    struct MACDResult {
        bool valid;         // false when history is shorter than slow + signal
        double macd;        // fast EMA - slow EMA
        double signal;      // EMA of the MACD line
        double histogram;   // MACD - Signal

        MACDResult() : valid(false), macd(0), signal(0), histogram(0) {}
    };

    // Per-bar series, tail aligned: back() is the latest closed bar.
    struct MACDSeries {
        std::vector<double> macd;
        std::vector<double> signal;
        std::vector<double> histogram;
    };

    static size_t minimumMACDHistory(int slow, int signal_period) {
        return static_cast<size_t>(slow + signal_period);
    }

    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);
    static MACDSeries calculateMACDSeries(const std::vector<double>& prices,
                                          int fast = 12, int slow = 26, int signal_period = 9);

    // EMA seeded with the SMA of the first `period` values.
    static double calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    static double calculateSMA(const std::vector<double>& prices, int period);
};

} // namespace analytics
} // namespace gapswing

#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>

using gapswing::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    const std::vector<double> prices = {10, 11, 12, 13, 12, 14, 15, 14, 16};

    // EMA seeded from the SMA of the first period
    {
        auto ema = TechnicalIndicators::calculateEMAVector(prices, 3);
        const std::vector<double> expected = {11, 12, 12, 13, 14, 14, 15};
        assert(ema.size() == expected.size());
        for (size_t i = 0; i < ema.size(); ++i) {
            assert(near(ema[i], expected[i]));
        }
        assert(near(TechnicalIndicators::calculateEMA(prices, 3), 15.0));
        assert(TechnicalIndicators::calculateEMAVector(prices, 10).empty());
        assert(near(TechnicalIndicators::calculateSMA(prices, 3), 15.0));
    }

    // Known values with short periods
    {
        auto macd = TechnicalIndicators::calculateMACD(prices, 2, 3, 2);
        assert(macd.valid);
        assert(near(macd.macd, 0.3847736625514404));
        assert(near(macd.signal, 0.3381344307270235));
        assert(near(macd.histogram, 0.04663923182441693));
        assert(near(macd.histogram, macd.macd - macd.signal));

        auto series = TechnicalIndicators::calculateMACDSeries(prices, 2, 3, 2);
        assert(series.histogram.size() == 6);
        assert(series.macd.size() == series.histogram.size());
        assert(near(series.histogram.back(), macd.histogram));
        assert(near(series.histogram[1], -0.11111111111111133));
    }

    // Warm-up: slow + signal bars
    {
        assert(TechnicalIndicators::minimumMACDHistory(3, 2) == 5);
        std::vector<double> four(prices.begin(), prices.begin() + 4);
        std::vector<double> five(prices.begin(), prices.begin() + 5);
        assert(!TechnicalIndicators::calculateMACD(four, 2, 3, 2).valid);
        auto macd = TechnicalIndicators::calculateMACD(five, 2, 3, 2);
        assert(macd.valid);
        assert(near(macd.histogram, -0.11111111111111133));

        std::vector<double> short_default(34, 100.0);
        assert(!TechnicalIndicators::calculateMACD(short_default).valid);
        assert(!TechnicalIndicators::calculateMACD(prices, 3, 2, 2).valid);
    }

    // Determinism and no look-ahead: appending a bar never changes earlier values
    {
        auto a = TechnicalIndicators::calculateMACDSeries(prices, 2, 3, 2);
        auto b = TechnicalIndicators::calculateMACDSeries(prices, 2, 3, 2);
        assert(a.histogram == b.histogram);

        std::vector<double> longer = prices;
        longer.push_back(9.0);
        auto c = TechnicalIndicators::calculateMACDSeries(longer, 2, 3, 2);
        assert(c.histogram.size() == a.histogram.size() + 1);
        for (size_t i = 0; i < a.histogram.size(); ++i) {
            assert(near(c.histogram[i], a.histogram[i]));
        }
    }

    // Sign follows acceleration
    {
        std::vector<double> up;
        std::vector<double> down;
        for (int i = 0; i < 60; ++i) {
            up.push_back(100.0 * std::pow(1.02, i));
            down.push_back(1000.0 - 100.0 * std::pow(1.02, i));
        }
        auto bull = TechnicalIndicators::calculateMACD(up);
        auto bear = TechnicalIndicators::calculateMACD(down);
        assert(bull.valid && bear.valid);
        assert(bull.histogram > 0.0);
        assert(bear.histogram < 0.0);
        assert(near(bull.histogram, 2.2508868503287047, 1e-6));
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}

#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cstddef>

namespace gapswing {
namespace analytics {

TechnicalIndicators::MACDSeries TechnicalIndicators::calculateMACDSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries series;
    if (fast <= 0 || slow <= fast || signal_period <= 0) {
        return series;
    }
    if (prices.size() < minimumMACDHistory(slow, signal_period)) {
        return series;
    }

    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return series;

    // The two EMA vectors start at different bars; align them from the latest bar.
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;

    std::vector<double> macd_line;
    macd_line.reserve(min_size);
    for (size_t i = 0; i < min_size; ++i) {
        macd_line.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    auto signal_line = calculateEMAVector(macd_line, signal_period);
    if (signal_line.empty()) return series;

    const size_t offset_macd = macd_line.size() - signal_line.size();
    series.macd.assign(macd_line.begin() + static_cast<std::ptrdiff_t>(offset_macd), macd_line.end());
    series.signal = signal_line;
    series.histogram.reserve(signal_line.size());
    for (size_t i = 0; i < signal_line.size(); ++i) {
        series.histogram.push_back(series.macd[i] - series.signal[i]);
    }
    return series;
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    auto series = calculateMACDSeries(prices, fast, slow, signal_period);
    if (series.histogram.empty()) {
        return result;
    }

    result.valid = true;
    result.macd = series.macd.back();
    result.signal = series.signal.back();
    result.histogram = series.histogram.back();
    return result;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    auto values = calculateEMAVector(prices, period);
    return values.empty() ? 0.0 : values.back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

} // namespace analytics
} // namespace gapswing

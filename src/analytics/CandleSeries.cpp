#include "analytics/CandleSeries.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace gapswing {
namespace analytics {

namespace {
bool isWellFormed(const Candle& c) {
    if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
        !std::isfinite(c.low) || !std::isfinite(c.close)) {
        return false;
    }
    return c.high >= c.low && c.low > 0.0;
}

double toDouble(const nlohmann::json& val) {
    if (val.is_string()) {
        return std::stod(val.get<std::string>());
    }
    if (val.is_number()) {
        return val.get<double>();
    }
    throw std::invalid_argument("kline field is not numeric");
}
}

CandleSeries::CandleSeries(std::vector<Candle> candles) {
    candles.erase(std::remove_if(candles.begin(), candles.end(),
                                 [](const Candle& c) { return !isWellFormed(c); }),
                  candles.end());

    // stable_sort keeps arrival order among equal open_times, so the last copy wins below.
    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) { return a.open_time < b.open_time; });

    candles_.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!candles_.empty() && candles_.back().open_time == candle.open_time) {
            candles_.back() = candle;
        } else {
            candles_.push_back(candle);
        }
    }
}

CandleSeries CandleSeries::closedOnly(std::vector<Candle> candles, long long now_ms, long long timeframe_ms) {
    CandleSeries series(std::move(candles));
    while (!series.candles_.empty() && series.candles_.back().open_time + timeframe_ms > now_ms) {
        series.candles_.pop_back();
    }
    return series;
}

std::vector<Candle> CandleSeries::klinesToCandles(const nlohmann::json& klines) {
    std::vector<Candle> candles;
    if (!klines.is_array()) return candles;

    candles.reserve(klines.size());
    for (const auto& row : klines) {
        if (!row.is_array() || row.size() < 6) {
            continue;
        }
        Candle c;
        c.open_time = row[0].get<long long>();
        c.open = toDouble(row[1]);
        c.high = toDouble(row[2]);
        c.low = toDouble(row[3]);
        c.close = toDouble(row[4]);
        c.volume = toDouble(row[5]);
        candles.push_back(c);
    }
    return candles;
}

long long CandleSeries::timeframeToMs(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        throw std::invalid_argument("invalid timeframe: " + timeframe);
    }
    const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(timeframe.back())));
    const std::string digits = timeframe.substr(0, timeframe.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        throw std::invalid_argument("invalid timeframe: " + timeframe);
    }
    const long long count = std::stoll(digits);
    if (count <= 0) {
        throw std::invalid_argument("invalid timeframe: " + timeframe);
    }
    switch (unit) {
        case 'm': return count * 60LL * 1000LL;
        case 'h': return count * 60LL * 60LL * 1000LL;
        case 'd': return count * 24LL * 60LL * 60LL * 1000LL;
        default: break;
    }
    throw std::invalid_argument("invalid timeframe: " + timeframe);
}

std::vector<double> CandleSeries::closes() const {
    std::vector<double> prices;
    prices.reserve(candles_.size());
    for (const auto& c : candles_) {
        prices.push_back(c.close);
    }
    return prices;
}

std::optional<size_t> CandleSeries::indexOf(long long open_time) const {
    auto it = std::lower_bound(candles_.begin(), candles_.end(), open_time,
                               [](const Candle& c, long long t) { return c.open_time < t; });
    if (it == candles_.end() || it->open_time != open_time) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - candles_.begin());
}

size_t CandleSeries::firstAfter(long long open_time) const {
    auto it = std::upper_bound(candles_.begin(), candles_.end(), open_time,
                               [](long long t, const Candle& c) { return t < c.open_time; });
    return static_cast<size_t>(it - candles_.begin());
}

} // namespace analytics
} // namespace gapswing

#include "execution/BinanceMarketData.h"
#include "analytics/CandleSeries.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "core/contracts/IExecutionProvider.h"
#include <stdexcept>

namespace gapswing {
namespace execution {

namespace {
double stringField(const nlohmann::json& node, const char* key) {
    const auto& value = node.at(key);
    return value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
}
}

BinanceMarketData::BinanceMarketData(std::shared_ptr<network::BinanceHttpClient> client)
    : client_(std::move(client))
{
}

std::vector<Candle> BinanceMarketData::getCandles(const std::string& symbol, const std::string& timeframe, int limit) {
    try {
        auto klines = client_->getKlines(symbol, timeframe, limit);
        auto candles = analytics::CandleSeries::klinesToCandles(klines);
        if (candles.empty()) {
            throw core::DataUnavailableError("no candles returned for " + symbol);
        }
        return candles;
    } catch (const core::DataUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::DataUnavailableError("candles for " + symbol + ": " + e.what());
    }
}

double BinanceMarketData::getTicker(const std::string& symbol) {
    try {
        return parseTickerPrice(client_->getTickerPrice(symbol));
    } catch (const std::exception& e) {
        throw core::DataUnavailableError("ticker for " + symbol + ": " + e.what());
    }
}

double BinanceMarketData::parseTickerPrice(const nlohmann::json& ticker) {
    const double price = stringField(ticker, "price");
    if (!(price > 0.0)) {
        throw std::runtime_error("non-positive ticker price");
    }
    return price;
}

std::optional<SymbolMeta> BinanceMarketData::symbolMeta(const std::string& symbol) {
    auto cached = meta_cache_.find(symbol);
    if (cached != meta_cache_.end()) {
        return cached->second;
    }

    if (!exchange_info_) {
        try {
            exchange_info_ = client_->getExchangeInfo();
        } catch (const std::exception& e) {
            LOG_WARN("exchangeInfo unavailable, using default symbol rules: {}", e.what());
            return std::nullopt;
        }
    }

    auto meta = parseSymbolMeta(*exchange_info_, symbol);
    if (meta) {
        meta_cache_[symbol] = *meta;
    } else {
        LOG_WARN("{} not found in exchangeInfo, using default symbol rules", symbol);
    }
    return meta;
}

std::optional<SymbolMeta> BinanceMarketData::parseSymbolMeta(const nlohmann::json& exchange_info, const std::string& symbol) {
    if (!exchange_info.contains("symbols") || !exchange_info["symbols"].is_array()) {
        return std::nullopt;
    }

    for (const auto& entry : exchange_info["symbols"]) {
        if (entry.value("symbol", std::string()) != symbol) {
            continue;
        }

        SymbolMeta meta;
        meta.price_precision = entry.value("pricePrecision", meta.price_precision);
        meta.size_precision = entry.value("quantityPrecision", meta.size_precision);

        try {
            for (const auto& filter : entry.value("filters", nlohmann::json::array())) {
                const std::string type = filter.value("filterType", std::string());
                if (type == "LOT_SIZE") {
                    meta.size_step = stringField(filter, "stepSize");
                    meta.min_order_size = stringField(filter, "minQty");
                } else if (type == "PRICE_FILTER") {
                    meta.price_tick = stringField(filter, "tickSize");
                } else if (type == "MIN_NOTIONAL") {
                    // Futures name the field "notional", spot "minNotional".
                    meta.min_notional = filter.contains("notional")
                        ? stringField(filter, "notional")
                        : stringField(filter, "minNotional");
                }
            }
        } catch (const std::exception& e) {
            LOG_WARN("{} has malformed exchange filters: {}", symbol, e.what());
            return std::nullopt;
        }

        if (meta.size_step > 0.0) {
            meta.size_precision = common::decimalsForStep(meta.size_step);
        }
        if (meta.price_tick > 0.0) {
            meta.price_precision = common::decimalsForStep(meta.price_tick);
        }
        return meta;
    }
    return std::nullopt;
}

} // namespace execution
} // namespace gapswing

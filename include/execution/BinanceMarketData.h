#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "network/BinanceHttpClient.h"

namespace gapswing {
namespace execution {

// Public market data shared by the paper and live executors. Transport
// failures surface as core::DataUnavailableError.
class BinanceMarketData {
public:
    explicit BinanceMarketData(std::shared_ptr<network::BinanceHttpClient> client);

    std::vector<Candle> getCandles(const std::string& symbol, const std::string& timeframe, int limit);
    double getTicker(const std::string& symbol);

    // exchangeInfo is fetched once and cached. nullopt when unavailable.
    std::optional<SymbolMeta> symbolMeta(const std::string& symbol);

    static std::optional<SymbolMeta> parseSymbolMeta(const nlohmann::json& exchange_info, const std::string& symbol);
    static double parseTickerPrice(const nlohmann::json& ticker);

    network::BinanceHttpClient& client() { return *client_; }

private:
    std::shared_ptr<network::BinanceHttpClient> client_;
    std::optional<nlohmann::json> exchange_info_;
    std::map<std::string, SymbolMeta> meta_cache_;
};

} // namespace execution
} // namespace gapswing

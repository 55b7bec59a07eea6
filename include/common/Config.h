#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace gapswing {

struct ExchangeConfig {
    std::string name = "binance-futures";
    std::string base_url = "https://fapi.binance.com";
    bool testnet = false;
    long long recv_window_ms = 5000;
    int max_retries = 3;
};

class Config {
public:
    static Config& getInstance();

    // Throws std::runtime_error when the file is missing or not valid JSON.
    void load(const std::string& config_path);
    // Same as load() for an already parsed document.
    void loadFromJson(const nlohmann::json& j);

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    bool hasApiCredentials() const { return !api_key_.empty() && !api_secret_.empty(); }

    const ExchangeConfig& getExchangeConfig() const { return exchange_config_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    void setMode(engine::TradingMode mode) { engine_config_.mode = mode; }

private:
    Config() = default;
    void resetToDefaults();

    std::string api_key_;
    std::string api_secret_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    ExchangeConfig exchange_config_;
    engine::EngineConfig engine_config_;
    engine::BacktestConfig backtest_config_;
};

} // namespace gapswing

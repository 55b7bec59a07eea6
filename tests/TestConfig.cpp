#include "common/Config.h"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

// Simple manual test runner
int main() {
    using namespace gapswing;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Defaults from an empty document
    config.loadFromJson(nlohmann::json::object());
    {
        const auto ec = config.getEngineConfig();
        assert(ec.mode == engine::TradingMode::PAPER);
        assert(ec.timeframe == "4h");
        assert(ec.settle_buffer_seconds == 30);
        assert(ec.strategy.macd_fast == 12);
        assert(ec.strategy.macd_slow == 26);
        assert(ec.strategy.macd_signal == 9);
        assert(ec.strategy.fvg_max_active == 3);
        assert(ec.strategy.fvg_max_age_bars == 20);
        assert(std::abs(ec.strategy.reward_risk - 2.0) < 1e-12);
        assert(!ec.strategy.require_recent_crossover);
        assert(std::abs(ec.risk.risk_per_trade_pct - 0.01) < 1e-12);
        assert(std::abs(ec.risk.max_daily_loss_pct - 0.05) < 1e-12);
        assert(ec.risk.max_concurrent_positions == 5);
        assert(config.getExchangeConfig().base_url == "https://fapi.binance.com");
        assert(config.getLogLevel() == "info");
    }

    // 2. Overrides, API keys from the environment only
    setenv("GAPSWING_API_KEY", " env-key ", 1);
    setenv("GAPSWING_API_SECRET", "env-secret", 1);
    config.loadFromJson({
        {"exchange", {{"testnet", true}, {"api_key", "file-key"}, {"max_retries", 5}}},
        {"trading", {{"mode", "live"}, {"symbols", nlohmann::json::array({"solusdt", "BTCUSDT"})}, {"timeframe", "1h"}}},
        {"strategy", {{"macd_fast", 5}, {"macd_slow", 10}, {"require_recent_crossover", true}}},
        {"risk", {{"max_concurrent_positions", 2}, {"breakeven_at_r", 1.0}}},
        {"backtest", {{"data_dir", "data/custom"}, {"warmup_bars", 10}}},
        {"logging", {{"level", "debug"}, {"event_journal", "logs/custom.jsonl"}}},
        {"unknown_section", {{"ignored", 1}}}
    });
    {
        const auto ec = config.getEngineConfig();
        assert(ec.mode == engine::TradingMode::LIVE);
        assert(ec.symbols.size() == 2);
        assert(ec.symbols[0] == "SOLUSDT");
        assert(ec.timeframe == "1h");
        assert(ec.strategy.macd_fast == 5);
        assert(ec.strategy.macd_slow == 10);
        assert(ec.strategy.macd_signal == 9);
        assert(ec.strategy.require_recent_crossover);
        assert(ec.risk.max_concurrent_positions == 2);
        assert(ec.event_journal_file == "logs/custom.jsonl");
        assert(config.getBacktestConfig().data_dir == "data/custom");
        assert(config.getBacktestConfig().warmup_bars == 10);
        assert(config.getExchangeConfig().testnet);
        assert(config.getExchangeConfig().base_url == "https://testnet.binancefuture.com");
        assert(config.getExchangeConfig().max_retries == 5);
        assert(config.getApiKey() == "env-key");
        assert(config.getApiSecret() == "env-secret");
        assert(config.hasApiCredentials());
        assert(config.getLogLevel() == "debug");
    }
    unsetenv("GAPSWING_API_KEY");
    unsetenv("GAPSWING_API_SECRET");

    // 3. Invalid values are startup failures
    bool threw = false;
    try {
        config.loadFromJson({{"strategy", {{"macd_fast", 26}, {"macd_slow", 12}}}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        config.loadFromJson({{"trading", {{"timeframe", "4x"}}}});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        config.load("does/not/exist.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    const auto bad_path = std::filesystem::temp_directory_path() / "gapswing_bad_config.json";
    {
        std::ofstream out(bad_path);
        out << "{ \"trading\": ";
    }
    threw = false;
    try {
        config.load(bad_path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::filesystem::remove(bad_path);

    // 4. Shipped example config
    if (std::filesystem::exists("config/config.json")) {
        config.load("config/config.json");
        assert(!config.getEngineConfig().symbols.empty());
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}

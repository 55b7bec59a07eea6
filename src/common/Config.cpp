#include "common/Config.h"
#include "analytics/CandleSeries.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace gapswing {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

engine::TradingMode parseMode(const std::string& raw) {
    const std::string mode = toUpperCopy(raw);
    if (mode == "LIVE") return engine::TradingMode::LIVE;
    if (mode == "BACKTEST") return engine::TradingMode::BACKTEST;
    if (mode != "PAPER") {
        std::cout << "Warning: unknown trading mode '" << raw << "', using PAPER" << std::endl;
    }
    return engine::TradingMode::PAPER;
}

const char* kTestnetUrl = "https://testnet.binancefuture.com";
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    api_key_.clear();
    api_secret_.clear();
    log_level_ = "info";
    log_dir_ = "logs";
    exchange_config_ = ExchangeConfig();
    engine_config_ = engine::EngineConfig();
    backtest_config_ = engine::BacktestConfig();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path(path);
    std::cout << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed config " + config_path.string() + ": " + e.what());
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    resetToDefaults();
    if (!j.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    try {
        if (j.contains("exchange")) {
            const auto& e = j["exchange"];
            exchange_config_.name = e.value("name", exchange_config_.name);
            exchange_config_.testnet = e.value("testnet", false);
            exchange_config_.base_url = e.value(
                "base_url", exchange_config_.testnet ? std::string(kTestnetUrl) : exchange_config_.base_url);
            exchange_config_.recv_window_ms = e.value("recv_window_ms", 5000LL);
            exchange_config_.max_retries = std::max(1, e.value("max_retries", 3));

            const std::string file_key = trimCopy(e.value("api_key", ""));
            const std::string file_secret = trimCopy(e.value("api_secret", ""));
            if (!file_key.empty() || !file_secret.empty()) {
                std::cout << "Warning: API keys in the config file are ignored. "
                          << "Use GAPSWING_API_KEY / GAPSWING_API_SECRET." << std::endl;
            }
        }

        api_key_ = readEnvVar("GAPSWING_API_KEY");
        api_secret_ = readEnvVar("GAPSWING_API_SECRET");

        if (j.contains("trading")) {
            const auto& t = j["trading"];
            engine_config_.mode = parseMode(t.value("mode", "PAPER"));
            if (t.contains("symbols") && t["symbols"].is_array()) {
                engine_config_.symbols.clear();
                for (const auto& s : t["symbols"]) {
                    const std::string symbol = toUpperCopy(s.get<std::string>());
                    if (!symbol.empty() &&
                        std::find(engine_config_.symbols.begin(), engine_config_.symbols.end(), symbol) ==
                            engine_config_.symbols.end()) {
                        engine_config_.symbols.push_back(symbol);
                    }
                }
            }
            engine_config_.timeframe = t.value("timeframe", engine_config_.timeframe);
            engine_config_.candle_limit = t.value("candle_limit", engine_config_.candle_limit);
            engine_config_.settle_buffer_seconds = t.value("settle_buffer_seconds", engine_config_.settle_buffer_seconds);
            engine_config_.starting_balance = t.value("starting_balance", engine_config_.starting_balance);
            engine_config_.state_file = t.value("state_file", engine_config_.state_file);
        }

        if (j.contains("strategy")) {
            const auto& s = j["strategy"];
            auto& sc = engine_config_.strategy;
            sc.macd_fast = s.value("macd_fast", sc.macd_fast);
            sc.macd_slow = s.value("macd_slow", sc.macd_slow);
            sc.macd_signal = s.value("macd_signal", sc.macd_signal);
            sc.fvg_max_active = s.value("fvg_max_active", sc.fvg_max_active);
            sc.fvg_max_age_bars = s.value("fvg_max_age_bars", sc.fvg_max_age_bars);
            sc.fvg_retired_history = s.value("fvg_retired_history", sc.fvg_retired_history);
            sc.stop_buffer_pct = s.value("stop_buffer_pct", sc.stop_buffer_pct);
            sc.reward_risk = s.value("reward_risk", sc.reward_risk);
            sc.require_recent_crossover = s.value("require_recent_crossover", sc.require_recent_crossover);
            sc.crossover_lookback = s.value("crossover_lookback", sc.crossover_lookback);
        }

        if (j.contains("risk")) {
            const auto& r = j["risk"];
            auto& rc = engine_config_.risk;
            rc.risk_per_trade_pct = r.value("risk_per_trade_pct", rc.risk_per_trade_pct);
            rc.max_daily_loss_pct = r.value("max_daily_loss_pct", rc.max_daily_loss_pct);
            rc.max_concurrent_positions = r.value("max_concurrent_positions", rc.max_concurrent_positions);
            rc.max_order_notional = r.value("max_order_notional", rc.max_order_notional);
            rc.breakeven_at_r = r.value("breakeven_at_r", rc.breakeven_at_r);
            rc.closed_history_limit = r.value("closed_history_limit", rc.closed_history_limit);
            rc.default_min_order_size = r.value("default_min_order_size", rc.default_min_order_size);
            rc.default_min_notional = r.value("default_min_notional", rc.default_min_notional);
            rc.default_size_step = r.value("default_size_step", rc.default_size_step);
            rc.default_price_tick = r.value("default_price_tick", rc.default_price_tick);
        }

        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            backtest_config_.data_dir = b.value("data_dir", backtest_config_.data_dir);
            backtest_config_.warmup_bars = b.value("warmup_bars", backtest_config_.warmup_bars);
            backtest_config_.min_order_size = b.value("min_order_size", backtest_config_.min_order_size);
            backtest_config_.min_notional = b.value("min_notional", backtest_config_.min_notional);
            backtest_config_.size_step = b.value("size_step", backtest_config_.size_step);
            backtest_config_.price_tick = b.value("price_tick", backtest_config_.price_tick);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level_ = l.value("level", log_level_);
            log_dir_ = l.value("dir", log_dir_);
            engine_config_.event_journal_file = l.value("event_journal", engine_config_.event_journal_file);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("invalid config value: ") + e.what());
    }

    const auto& sc = engine_config_.strategy;
    if (sc.macd_fast <= 0 || sc.macd_slow <= sc.macd_fast || sc.macd_signal <= 0) {
        throw std::runtime_error("invalid MACD periods");
    }
    if (sc.fvg_max_active <= 0 || sc.fvg_max_age_bars <= 0) {
        throw std::runtime_error("invalid gap book limits");
    }
    if (sc.reward_risk <= 0.0 || sc.stop_buffer_pct < 0.0) {
        throw std::runtime_error("invalid stop / reward settings");
    }
    if (engine_config_.symbols.empty()) {
        throw std::runtime_error("no symbols configured");
    }
    try {
        analytics::CandleSeries::timeframeToMs(engine_config_.timeframe);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
}

} // namespace gapswing

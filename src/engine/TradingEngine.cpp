#include "engine/TradingEngine.h"
#include "common/Logger.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace gapswing {
namespace engine {

namespace {

nlohmann::json gapPayload(const analytics::FairValueGap& gap) {
    return {
        {"direction", directionToString(gap.direction)},
        {"top", gap.top},
        {"bottom", gap.bottom},
        {"created_at", gap.created_at},
        {"status", analytics::gapStatusToString(gap.status)},
        {"retired_at", gap.retired_at}
    };
}

nlohmann::json positionPayload(const risk::Position& position) {
    nlohmann::json payload = {
        {"direction", directionToString(position.direction)},
        {"entry_price", position.entry_price},
        {"size", position.size},
        {"stop_loss", position.stop_loss},
        {"take_profit", position.take_profit},
        {"gap_ref", position.gap_ref},
        {"order_ref", position.order_ref}
    };
    if (position.status == risk::PositionStatus::CLOSED) {
        payload["exit_price"] = position.exit_price;
        payload["exit_reason"] = risk::exitReasonToString(position.exit_reason);
        payload["realized_pnl"] = position.realized_pnl;
    }
    return payload;
}

std::string sideToString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

} // namespace

TradingEngine::TradingEngine(const EngineConfig& config,
                             std::shared_ptr<core::IExecutionProvider> provider,
                             std::shared_ptr<core::IStateStore> store,
                             std::shared_ptr<core::IEventJournal> journal)
    : config_(config)
    , timeframe_ms_(analytics::CandleSeries::timeframeToMs(config.timeframe))
    , provider_(std::move(provider))
    , store_(std::move(store))
    , journal_(std::move(journal))
    , detector_(config.strategy.fvg_max_active, config.strategy.fvg_max_age_bars,
                config.strategy.fvg_retired_history)
    , evaluator_(config.strategy)
    , risk_manager_(config.risk)
    , dirty_(false)
    , running_(false)
    , start_time_(0)
    , total_ticks_(0)
{
    LOG_INFO("TradingEngine initialized");
    LOG_INFO("Mode: {} ({}), timeframe {}, {} symbols",
             tradingModeToString(config_.mode), provider_->name(), config_.timeframe, config_.symbols.size());
    LOG_INFO("Risk: {:.2f}% per trade, daily loss limit {:.1f}%, max {} positions",
             config_.risk.risk_per_trade_pct * 100.0, config_.risk.max_daily_loss_pct * 100.0,
             config_.risk.max_concurrent_positions);
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== Startup =====

void TradingEngine::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto loaded = store_->load();
    const long long now = provider_->currentTimeMs();
    if (loaded) {
        state_ = *loaded;
        state_.risk.portfolio_position_count = static_cast<int>(state_.open_positions.size());
        for (const auto& entry : state_.open_positions) {
            state_.risk.per_symbol_position_flag[entry.first] = true;
        }
        LOG_INFO("State restored: balance {:.2f}, {} open positions, {} gap books",
                 state_.risk.current_balance, state_.open_positions.size(), state_.gap_books.size());
        return;
    }

    double balance = config_.starting_balance;
    if (config_.mode == TradingMode::LIVE) {
        auto fetched = provider_->fetchBalance();
        if (fetched) {
            balance = *fetched;
        } else {
            LOG_WARN("Balance unavailable, starting from configured {:.2f}", balance);
        }
    }

    state_ = core::EngineState();
    risk_manager_.initializeDay(state_.risk, balance, now);
    state_.saved_at_ms = now;
    if (!store_->save(state_)) {
        throw core::StateStoreError("cannot write initial state");
    }
    LOG_INFO("Fresh state: balance {:.2f}", balance);
}

// ===== Engine control =====

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("Engine already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine start");
    LOG_INFO("========================================");

    running_ = true;
    start_time_ = currentTimeMs();
    worker_thread_ = std::make_unique<std::thread>(&TradingEngine::run, this);
    return true;
}

void TradingEngine::stop() {
    if (!running_) {
        if (worker_thread_ && worker_thread_->joinable()) {
            worker_thread_->join();
        }
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine stop");
    LOG_INFO("========================================");

    running_ = false;
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    logSummary();
}

// ===== Main loop =====

void TradingEngine::run() {
    LOG_INFO("Main loop started");

    while (running_) {
        try {
            runTick([this]() { return !running_; });
        } catch (const std::exception& e) {
            LOG_ERROR("Tick failed: {}", e.what());
        }

        // Next bar close, plus a settle buffer so the exchange has published it.
        const long long now = provider_->currentTimeMs();
        const long long next_wake = (now / timeframe_ms_ + 1) * timeframe_ms_ +
                                    static_cast<long long>(config_.settle_buffer_seconds) * 1000LL;
        LOG_INFO("Next tick in {} s", (next_wake - now) / 1000);

        while (running_ && provider_->currentTimeMs() < next_wake) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    LOG_INFO("Main loop finished");
}

TickReport TradingEngine::runTick(const std::function<bool()>& should_abort) {
    std::lock_guard<std::mutex> lock(mutex_);

    TickReport report;
    report.started_at = provider_->currentTimeMs();
    tick_candles_.clear();
    total_ticks_++;

    if (dirty_) {
        LOG_WARN("Retrying state save left over from the previous tick");
        persist();
    }

    if (risk_manager_.refreshTradingDay(state_.risk, report.started_at)) {
        report.daily_reset = true;
        journal(core::JournalEventType::DAILY_RESET, "", "", {
            {"day_start_balance", state_.risk.day_start_balance}
        });
        persist();
    }

    if (config_.mode == TradingMode::LIVE) {
        auto balance = provider_->fetchBalance();
        if (balance) {
            risk_manager_.syncBalance(state_.risk, *balance);
            risk_manager_.updateDailyLossGuard(state_.risk);
            persist();
        } else {
            LOG_WARN("Balance sync skipped: balance unavailable");
        }
    }

    managePositions(report, should_abort);

    for (const auto& symbol : config_.symbols) {
        if (report.aborted || (should_abort && should_abort())) {
            report.aborted = true;
            LOG_INFO("Stop requested, tick interrupted before {}", symbol);
            break;
        }
        scanSymbol(symbol, report);
    }

    tick_candles_.clear();
    LOG_INFO("Tick done: {} scanned, {} skipped, {} gaps new, {} signals, {} rejected, {} opened, {} closed",
             report.symbols_scanned, report.symbols_skipped, report.gaps_created,
             report.signals_confirmed, report.rejectionCount(), report.positions_opened,
             report.closed_positions.size());
    return report;
}

// ===== Manage phase =====

void TradingEngine::managePositions(TickReport& report, const std::function<bool()>& should_abort) {
    std::vector<std::string> symbols;
    for (const auto& entry : state_.open_positions) {
        symbols.push_back(entry.first);
    }

    for (const auto& symbol : symbols) {
        if (should_abort && should_abort()) {
            report.aborted = true;
            LOG_INFO("Stop requested, position management interrupted before {}", symbol);
            return;
        }
        try {
            manageSymbol(symbol, report);
        } catch (const core::DataUnavailableError& e) {
            LOG_WARN("{} position check skipped: {}", symbol, e.what());
        }
    }
}

void TradingEngine::manageSymbol(const std::string& symbol, TickReport& report) {
    const auto& series = closedCandles(symbol);
    const auto execute = exitExecutor();

    // Bars that closed after the fill and have not been checked yet.
    const long long checked = state_.open_positions.at(symbol).last_checked_bar;
    for (size_t i = series.firstAfter(checked); i < series.size(); ++i) {
        const Candle& bar = series.at(i);
        const long long bar_close = bar.open_time + timeframe_ms_;
        if (bar_close <= state_.open_positions.at(symbol).opened_at) {
            continue;
        }

        auto closed = risk_manager_.manageBar(state_, symbol, bar, bar_close, execute);
        persist();
        if (closed) {
            recordClose(*closed, report);
            return;
        }
        // A level was crossed but the exit order failed. The bar stays
        // unchecked and no ticker exit is sent on top of it this tick.
        if (state_.open_positions.at(symbol).last_checked_bar < bar.open_time) {
            LOG_WARN("{} exit on bar {} pending, retried next tick", symbol, bar.open_time);
            return;
        }
    }

    const double price = provider_->getTicker(symbol);
    auto closed = risk_manager_.manage(state_, symbol, price, provider_->currentTimeMs(), execute);
    persist();
    if (closed) {
        recordClose(*closed, report);
    }
}

risk::ExitExecutor TradingEngine::exitExecutor() {
    return [this](const risk::Position& position, const risk::ExitCheck& check) -> std::optional<double> {
        auto fill = provider_->closePosition(position.symbol, position.direction, position.size, check.exit_price);
        if (!fill) {
            journal(core::JournalEventType::ORDER_FAILED, position.symbol, position.id, {
                {"action", "close"},
                {"reason", risk::exitReasonToString(check.reason)},
                {"reference_price", check.exit_price}
            });
            return std::nullopt;
        }
        journal(core::JournalEventType::ORDER_FILLED, position.symbol, fill->order_id, {
            {"action", "close"},
            {"side", sideToString(fill->side)},
            {"price", fill->price},
            {"size", fill->size}
        });
        return fill->price;
    };
}

void TradingEngine::recordClose(const risk::Position& position, TickReport& report) {
    report.closed_positions.push_back(position);
    journal(core::JournalEventType::POSITION_CLOSED, position.symbol, position.id, positionPayload(position));
    Logger::getInstance().logTrade(position.symbol, sideToString(exitSide(position.direction)),
                                   position.exit_price, position.size, position.realized_pnl,
                                   risk::exitReasonToString(position.exit_reason));
}

// ===== Scan phase =====

void TradingEngine::scanSymbol(const std::string& symbol, TickReport& report) {
    const analytics::CandleSeries* series = nullptr;
    try {
        series = &closedCandles(symbol);
    } catch (const core::DataUnavailableError& e) {
        LOG_WARN("{} skipped this tick: {}", symbol, e.what());
        report.symbols_skipped++;
        return;
    }
    if (series->size() < 3) {
        LOG_WARN("{} skipped this tick: only {} closed bars", symbol, series->size());
        report.symbols_skipped++;
        return;
    }
    report.symbols_scanned++;

    auto& book = state_.gap_books[symbol];
    auto update = detector_.update(symbol, book, *series);
    if (update.changed()) {
        for (const auto& gap : update.created) {
            journal(core::JournalEventType::GAP_CREATED, symbol, gap.id, gapPayload(gap));
        }
        for (const auto& gap : update.retired) {
            journal(core::JournalEventType::GAP_RETIRED, symbol, gap.id, gapPayload(gap));
        }
        report.gaps_created += static_cast<int>(update.created.size());
        report.gaps_retired += static_cast<int>(update.retired.size());
        persist();
    }

    const Candle& latest = series->back();
    if (latest.open_time <= book.last_evaluated_bar_time) {
        LOG_DEBUG("{} bar {} already evaluated", symbol, latest.open_time);
        return;
    }

    const auto& cfg = config_.strategy;
    const auto closes = series->closes();
    const auto macd = analytics::TechnicalIndicators::calculateMACD(closes, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal);
    if (!macd.valid) {
        LOG_WARN("{} skipped this tick: {} bars, MACD needs {}", symbol, closes.size(),
                 analytics::TechnicalIndicators::minimumMACDHistory(cfg.macd_slow, cfg.macd_signal));
        return;
    }

    std::vector<double> histogram;
    if (cfg.require_recent_crossover) {
        histogram = analytics::TechnicalIndicators::calculateMACDSeries(
            closes, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal).histogram;
    }

    auto evaluation = evaluator_.evaluate(symbol, book.active, latest, macd,
                                          state_.hasOpenPosition(symbol), histogram);
    book.last_evaluated_bar_time = latest.open_time;

    for (const auto& rejection : evaluation.rejections) {
        recordRejection(rejection, "", report);
    }
    // Consumed touches are saved before any order goes out.
    persist();

    if (evaluation.signal) {
        executeSignal(*evaluation.signal, report);
    }
}

void TradingEngine::executeSignal(const strategy::Signal& signal, TickReport& report) {
    report.signals_confirmed++;
    LOG_INFO("Signal: {} {} entry {:.8f} SL {:.8f} TP {:.8f} (hist {:.8f}, gap {})",
             signal.symbol, directionToString(signal.direction), signal.entry_price,
             signal.stop_loss, signal.take_profit, signal.histogram, signal.gap_ref);
    journal(core::JournalEventType::SIGNAL_CONFIRMED, signal.symbol, signal.gap_ref, {
        {"direction", directionToString(signal.direction)},
        {"entry_price", signal.entry_price},
        {"stop_loss", signal.stop_loss},
        {"take_profit", signal.take_profit},
        {"macd", signal.macd},
        {"macd_signal", signal.macd_signal},
        {"histogram", signal.histogram},
        {"macd_state", strategy::macdStateToString(signal.macd_state)}
    });

    strategy::SignalRejection rejection;
    rejection.symbol = signal.symbol;
    rejection.gap_ref = signal.gap_ref;
    rejection.direction = signal.direction;
    rejection.reference_price = signal.entry_price;
    rejection.timestamp = signal.timestamp;

    auto decision = risk_manager_.size(signal, state_.risk, provider_->symbolMeta(signal.symbol));
    if (!decision.approved) {
        rejection.reason = decision.reason;
        recordRejection(rejection, decision.detail, report);
        return;
    }

    core::ExecutionRequest request;
    request.symbol = signal.symbol;
    request.side = entrySide(signal.direction);
    request.direction = signal.direction;
    request.size = decision.size;
    request.reference_price = signal.entry_price;
    request.stop_loss = signal.stop_loss;
    request.take_profit = signal.take_profit;
    request.size_step = decision.meta.size_step;
    request.price_tick = decision.meta.price_tick;
    request.client_order_id = "gs-" + signal.symbol + "-" + std::to_string(signal.timestamp);

    auto fill = provider_->placeOrder(request);
    if (!fill || fill->size <= 0.0 || fill->status == OrderStatus::REJECTED ||
        fill->status == OrderStatus::CANCELLED) {
        LOG_ERROR("{} entry order failed (size {:.8f})", signal.symbol, request.size);
        journal(core::JournalEventType::ORDER_FAILED, signal.symbol, request.client_order_id, {
            {"action", "open"},
            {"side", sideToString(request.side)},
            {"size", request.size},
            {"reference_price", request.reference_price}
        });
        rejection.reason = strategy::RejectReason::EXECUTION_FAILED;
        recordRejection(rejection, "order not filled", report);
        return;
    }
    if (fill->status == OrderStatus::PARTIALLY_FILLED) {
        LOG_WARN("{} entry partially filled: {:.8f} of {:.8f}", signal.symbol, fill->size, request.size);
    }

    journal(core::JournalEventType::ORDER_FILLED, signal.symbol, fill->order_id, {
        {"action", "open"},
        {"side", sideToString(fill->side)},
        {"price", fill->price},
        {"size", fill->size}
    });

    const risk::Position& position = risk_manager_.open(state_, signal, *fill);
    report.positions_opened++;
    persist();
    journal(core::JournalEventType::POSITION_OPENED, position.symbol, position.id, positionPayload(position));
    Logger::getInstance().logTrade(position.symbol, sideToString(fill->side), position.entry_price,
                                   position.size, 0.0, "entry");
}

void TradingEngine::recordRejection(const strategy::SignalRejection& rejection, const std::string& detail,
                                    TickReport& report) {
    const std::string reason = strategy::rejectReasonToString(rejection.reason);
    report.rejections[rejection.reason]++;
    LOG_INFO("{} {} signal rejected: {}{}{}", rejection.symbol, directionToString(rejection.direction),
             reason, detail.empty() ? "" : " - ", detail);

    nlohmann::json payload = {
        {"direction", directionToString(rejection.direction)},
        {"reason", reason},
        {"reference_price", rejection.reference_price},
        {"bar_time", rejection.timestamp}
    };
    if (!detail.empty()) {
        payload["detail"] = detail;
    }
    journal(core::JournalEventType::SIGNAL_REJECTED, rejection.symbol, rejection.gap_ref, std::move(payload));
}

// ===== Helpers =====

const analytics::CandleSeries& TradingEngine::closedCandles(const std::string& symbol) {
    auto cached = tick_candles_.find(symbol);
    if (cached != tick_candles_.end()) {
        return cached->second;
    }

    auto candles = provider_->getCandles(symbol, config_.timeframe, config_.candle_limit);
    auto series = analytics::CandleSeries::closedOnly(std::move(candles), provider_->currentTimeMs(), timeframe_ms_);
    if (series.empty()) {
        throw core::DataUnavailableError("no closed " + config_.timeframe + " bars for " + symbol);
    }
    return tick_candles_.emplace(symbol, std::move(series)).first->second;
}

void TradingEngine::journal(core::JournalEventType type, const std::string& symbol,
                            const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = provider_->currentTimeMs();
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Event journal append failed: {} {}", core::journalEventTypeToString(type), entity_id);
    }
}

bool TradingEngine::persist() {
    state_.saved_at_ms = provider_->currentTimeMs();
    if (store_->save(state_)) {
        if (dirty_) {
            LOG_INFO("State saved after earlier failure");
        }
        dirty_ = false;
        return true;
    }

    LOG_ERROR("State save failed; keeping in-memory state and retrying next tick");
    if (!dirty_) {
        journal(core::JournalEventType::STATE_SAVE_FAILED, "", "", {
            {"open_positions", state_.open_positions.size()}
        });
    }
    dirty_ = true;
    return false;
}

core::EngineState TradingEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<risk::Position> TradingEngine::forceClosePosition(const std::string& symbol, risk::ExitReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.hasOpenPosition(symbol)) {
        LOG_WARN("No open position for {}", symbol);
        return std::nullopt;
    }

    double price = 0.0;
    try {
        price = provider_->getTicker(symbol);
    } catch (const core::DataUnavailableError& e) {
        LOG_ERROR("{} manual close failed: {}", symbol, e.what());
        return std::nullopt;
    }

    auto closed = risk_manager_.forceClose(state_, symbol, price, reason, provider_->currentTimeMs(), exitExecutor());
    if (closed) {
        persist();
        TickReport unused;
        recordClose(*closed, unused);
    }
    return closed;
}

void TradingEngine::logSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    int wins = 0;
    double total_pnl = 0.0;
    for (const auto& position : state_.closed_positions) {
        if (position.realized_pnl > 0.0) {
            wins++;
        }
        total_pnl += position.realized_pnl;
    }
    const size_t trades = state_.closed_positions.size();
    const double runtime_hours = start_time_ > 0 ? (currentTimeMs() - start_time_) / (1000.0 * 60.0 * 60.0) : 0.0;

    LOG_INFO("========================================");
    LOG_INFO("Session summary");
    LOG_INFO("========================================");
    LOG_INFO("Runtime: {:.1f} h, ticks: {}", runtime_hours, total_ticks_);
    LOG_INFO("Balance: {:.2f} (day start {:.2f})", state_.risk.current_balance, state_.risk.day_start_balance);
    LOG_INFO("Closed positions: {} (win rate {:.1f}%), realized PnL {:.2f}",
             trades, trades > 0 ? 100.0 * wins / static_cast<double>(trades) : 0.0, total_pnl);
    LOG_INFO("Open positions: {}", state_.open_positions.size());
    for (const auto& entry : state_.open_positions) {
        const auto& position = entry.second;
        LOG_INFO("  {} {} size {:.8f} @ {:.8f} (SL {:.8f}, TP {:.8f})",
                 position.symbol, directionToString(position.direction), position.size,
                 position.entry_price, position.stop_loss, position.take_profit);
    }
}

} // namespace engine
} // namespace gapswing

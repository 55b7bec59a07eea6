#include "risk/RiskManager.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace gapswing {
namespace risk {

namespace {
constexpr long long kDayMs = 24LL * 60LL * 60LL * 1000LL;
constexpr double kBalanceEpsilon = 1e-9;
}

std::string positionStatusToString(PositionStatus status) {
    return status == PositionStatus::OPEN ? "open" : "closed";
}

PositionStatus positionStatusFromString(const std::string& value) {
    if (value == "open") return PositionStatus::OPEN;
    if (value == "closed") return PositionStatus::CLOSED;
    throw std::invalid_argument("unknown position status: " + value);
}

std::string exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::NONE: return "none";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::MANUAL: return "manual";
        case ExitReason::FORCED: return "forced";
    }
    return "none";
}

ExitReason exitReasonFromString(const std::string& value) {
    if (value == "none") return ExitReason::NONE;
    if (value == "stop_loss") return ExitReason::STOP_LOSS;
    if (value == "take_profit") return ExitReason::TAKE_PROFIT;
    if (value == "manual") return ExitReason::MANUAL;
    if (value == "forced") return ExitReason::FORCED;
    throw std::invalid_argument("unknown exit reason: " + value);
}

RiskManager::RiskManager(const RiskConfig& config)
    : config_(config)
{
}

long long RiskManager::utcDayIndex(long long ms) {
    // Floor division so pre-epoch timestamps land on the right day.
    return ms >= 0 ? ms / kDayMs : -((-ms + kDayMs - 1) / kDayMs);
}

bool RiskManager::isNewTradingDay(long long last_reset_time, long long now_ms) {
    return utcDayIndex(now_ms) > utcDayIndex(last_reset_time);
}

void RiskManager::initializeDay(RiskState& risk, double balance, long long now_ms) const {
    risk.day_start_balance = balance;
    risk.current_balance = balance;
    risk.last_reset_time = now_ms;
    risk.daily_loss_guard_triggered = false;
}

bool RiskManager::refreshTradingDay(RiskState& risk, long long now_ms) const {
    if (!isNewTradingDay(risk.last_reset_time, now_ms)) {
        return false;
    }

    LOG_INFO("New trading day: baseline {:.2f} -> {:.2f}{}",
             risk.day_start_balance, risk.current_balance,
             risk.daily_loss_guard_triggered ? " (daily loss guard cleared)" : "");
    risk.day_start_balance = risk.current_balance;
    risk.last_reset_time = now_ms;
    risk.daily_loss_guard_triggered = false;
    return true;
}

void RiskManager::syncBalance(RiskState& risk, double balance) const {
    if (std::fabs(risk.current_balance - balance) > kBalanceEpsilon) {
        LOG_DEBUG("Balance sync: {:.2f} -> {:.2f}", risk.current_balance, balance);
    }
    risk.current_balance = balance;
}

bool RiskManager::isDailyLossBreached(const RiskState& risk) const {
    if (risk.day_start_balance <= 0.0) {
        return false;
    }
    const double loss = risk.day_start_balance - risk.current_balance;
    return loss > risk.day_start_balance * config_.max_daily_loss_pct + kBalanceEpsilon;
}

bool RiskManager::updateDailyLossGuard(RiskState& risk) const {
    if (risk.daily_loss_guard_triggered || !isDailyLossBreached(risk)) {
        return false;
    }
    risk.daily_loss_guard_triggered = true;
    LOG_WARN("Daily loss guard triggered: balance {:.2f} vs day start {:.2f} (limit {:.1f}%)",
             risk.current_balance, risk.day_start_balance, config_.max_daily_loss_pct * 100.0);
    return true;
}

SymbolMeta RiskManager::resolveMeta(const std::optional<SymbolMeta>& meta) const {
    SymbolMeta resolved;
    resolved.min_order_size = config_.default_min_order_size;
    resolved.min_notional = config_.default_min_notional;
    resolved.size_step = config_.default_size_step;
    resolved.price_tick = config_.default_price_tick;
    resolved.size_precision = common::decimalsForStep(resolved.size_step);
    resolved.price_precision = common::decimalsForStep(resolved.price_tick);
    if (!meta) {
        return resolved;
    }

    if (meta->size_step > 0.0) {
        resolved.size_step = meta->size_step;
        resolved.size_precision = meta->size_precision;
    }
    if (meta->price_tick > 0.0) {
        resolved.price_tick = meta->price_tick;
        resolved.price_precision = meta->price_precision;
    }
    resolved.min_order_size = meta->min_order_size;
    resolved.min_notional = meta->min_notional;
    return resolved;
}

SizingDecision RiskManager::size(const strategy::Signal& signal,
                                 const RiskState& risk,
                                 const std::optional<SymbolMeta>& meta) const {
    SizingDecision decision;

    auto flag = risk.per_symbol_position_flag.find(signal.symbol);
    if (flag != risk.per_symbol_position_flag.end() && flag->second) {
        decision.reason = strategy::RejectReason::POSITION_OPEN;
        decision.detail = signal.symbol + " already has an open position";
        return decision;
    }
    if (risk.portfolio_position_count >= config_.max_concurrent_positions) {
        decision.reason = strategy::RejectReason::PORTFOLIO_CAP;
        decision.detail = "open positions " + std::to_string(risk.portfolio_position_count) +
                          " >= " + std::to_string(config_.max_concurrent_positions);
        return decision;
    }
    if (risk.daily_loss_guard_triggered || isDailyLossBreached(risk)) {
        decision.reason = strategy::RejectReason::DAILY_LOSS_GUARD;
        decision.detail = "daily loss limit reached";
        return decision;
    }

    const double stop_distance = signal.riskPerUnit();
    if (stop_distance <= 0.0 || signal.entry_price <= 0.0) {
        decision.reason = strategy::RejectReason::INVALID_STOP;
        decision.detail = "zero stop distance";
        return decision;
    }

    decision.meta = resolveMeta(meta);
    decision.risk_amount = config_.risk_per_trade_pct * risk.current_balance;
    double raw_size = decision.risk_amount > 0.0 ? decision.risk_amount / stop_distance : 0.0;

    if (config_.max_order_notional > 0.0 && raw_size * signal.entry_price > config_.max_order_notional) {
        raw_size = config_.max_order_notional / signal.entry_price;
    }

    decision.size = common::floorToStep(raw_size, decision.meta.size_step);
    decision.notional = decision.size * signal.entry_price;

    if (decision.size <= 0.0 || decision.size + 1e-12 < decision.meta.min_order_size) {
        decision.reason = strategy::RejectReason::BELOW_MIN_SIZE;
        decision.detail = "size " + common::formatDecimal(decision.size, decision.meta.size_precision) +
                          " below minimum " + common::formatDecimal(decision.meta.min_order_size, decision.meta.size_precision);
        return decision;
    }
    if (decision.notional + 1e-9 < decision.meta.min_notional) {
        decision.reason = strategy::RejectReason::BELOW_MIN_SIZE;
        decision.detail = "notional " + common::formatDecimal(decision.notional, 2) +
                          " below minimum " + common::formatDecimal(decision.meta.min_notional, 2);
        return decision;
    }

    decision.approved = true;
    return decision;
}

Position& RiskManager::open(core::EngineState& state, const strategy::Signal& signal, const core::Fill& fill) const {
    if (state.hasOpenPosition(signal.symbol)) {
        throw std::logic_error(signal.symbol + " already has an open position");
    }

    Position position;
    position.id = signal.symbol + "-" + std::to_string(fill.timestamp);
    position.symbol = signal.symbol;
    position.direction = signal.direction;
    position.entry_price = fill.price;
    position.size = fill.size;
    position.stop_loss = signal.stop_loss;
    position.initial_stop_loss = signal.stop_loss;
    position.take_profit = signal.take_profit;
    position.opened_at = fill.timestamp;
    position.status = PositionStatus::OPEN;
    position.gap_ref = signal.gap_ref;
    position.order_ref = fill.order_id;

    auto& stored = state.open_positions[signal.symbol];
    stored = position;
    state.risk.per_symbol_position_flag[signal.symbol] = true;
    state.risk.portfolio_position_count = static_cast<int>(state.open_positions.size());

    LOG_INFO("Position opened: {} {} size {:.8f} @ {:.8f} (SL {:.8f}, TP {:.8f})",
             position.symbol, directionToString(position.direction), position.size,
             position.entry_price, position.stop_loss, position.take_profit);
    return stored;
}

ExitCheck RiskManager::checkExit(const Position& position, double price) const {
    ExitCheck check;
    if (position.direction == Direction::BULLISH) {
        if (price <= position.stop_loss) {
            check.reason = ExitReason::STOP_LOSS;
        } else if (price >= position.take_profit) {
            check.reason = ExitReason::TAKE_PROFIT;
        }
    } else {
        if (price >= position.stop_loss) {
            check.reason = ExitReason::STOP_LOSS;
        } else if (price <= position.take_profit) {
            check.reason = ExitReason::TAKE_PROFIT;
        }
    }
    if (check.reason != ExitReason::NONE) {
        check.triggered = true;
        check.exit_price = price;
    }
    return check;
}

ExitCheck RiskManager::checkExitBar(const Position& position, const Candle& bar) const {
    ExitCheck check;
    if (position.direction == Direction::BULLISH) {
        if (bar.low <= position.stop_loss) {
            check.reason = ExitReason::STOP_LOSS;
            check.exit_price = position.stop_loss;
        } else if (bar.high >= position.take_profit) {
            check.reason = ExitReason::TAKE_PROFIT;
            check.exit_price = position.take_profit;
        }
    } else {
        if (bar.high >= position.stop_loss) {
            check.reason = ExitReason::STOP_LOSS;
            check.exit_price = position.stop_loss;
        } else if (bar.low <= position.take_profit) {
            check.reason = ExitReason::TAKE_PROFIT;
            check.exit_price = position.take_profit;
        }
    }
    check.triggered = check.reason != ExitReason::NONE;
    return check;
}

bool RiskManager::applyBreakeven(Position& position, double favorable_price) const {
    if (config_.breakeven_at_r <= 0.0) {
        return false;
    }
    const int sign = directionSign(position.direction);
    // Already at or beyond entry.
    if ((position.stop_loss - position.entry_price) * sign >= 0.0) {
        return false;
    }

    const double trigger = position.entry_price + sign * config_.breakeven_at_r * position.riskPerUnit();
    if ((favorable_price - trigger) * sign < 0.0) {
        return false;
    }

    LOG_INFO("{} stop moved to break-even {:.8f} (from {:.8f})",
             position.symbol, position.entry_price, position.stop_loss);
    position.stop_loss = position.entry_price;
    return true;
}

std::optional<Position> RiskManager::executeExit(core::EngineState& state, const std::string& symbol,
                                                 const ExitCheck& check, long long now_ms,
                                                 const ExitExecutor& execute) const {
    const Position& position = state.open_positions.at(symbol);
    std::optional<double> fill_price = execute ? execute(position, check) : std::optional<double>(check.exit_price);
    if (!fill_price) {
        LOG_ERROR("{} exit ({}) not executed; position stays open", symbol, exitReasonToString(check.reason));
        return std::nullopt;
    }
    return close(state, symbol, *fill_price, check.reason, now_ms);
}

std::optional<Position> RiskManager::manage(core::EngineState& state, const std::string& symbol,
                                            double latest_price, long long now_ms,
                                            const ExitExecutor& execute) const {
    auto it = state.open_positions.find(symbol);
    if (it == state.open_positions.end()) {
        return std::nullopt;
    }

    ExitCheck check = checkExit(it->second, latest_price);
    if (!check.triggered) {
        applyBreakeven(it->second, latest_price);
        return std::nullopt;
    }
    return executeExit(state, symbol, check, now_ms, execute);
}

std::optional<Position> RiskManager::manageBar(core::EngineState& state, const std::string& symbol,
                                               const Candle& bar, long long bar_close_time,
                                               const ExitExecutor& execute) const {
    auto it = state.open_positions.find(symbol);
    if (it == state.open_positions.end()) {
        return std::nullopt;
    }

    Position& position = it->second;
    ExitCheck check = checkExitBar(position, bar);
    if (!check.triggered) {
        applyBreakeven(position, position.direction == Direction::BULLISH ? bar.high : bar.low);
        position.last_checked_bar = bar.open_time;
        return std::nullopt;
    }

    // On a failed exit the bar stays unchecked so the next tick retries it.
    return executeExit(state, symbol, check, bar_close_time, execute);
}

std::optional<Position> RiskManager::forceClose(core::EngineState& state, const std::string& symbol,
                                                double price, ExitReason reason, long long now_ms,
                                                const ExitExecutor& execute) const {
    if (!state.hasOpenPosition(symbol)) {
        LOG_WARN("forceClose: no open position for {}", symbol);
        return std::nullopt;
    }
    ExitCheck check;
    check.triggered = true;
    check.reason = reason;
    check.exit_price = price;
    return executeExit(state, symbol, check, now_ms, execute);
}

Position RiskManager::close(core::EngineState& state, const std::string& symbol,
                            double exit_price, ExitReason reason, long long closed_at) const {
    auto it = state.open_positions.find(symbol);
    if (it == state.open_positions.end()) {
        throw std::out_of_range("no open position for " + symbol);
    }

    Position position = it->second;
    position.status = PositionStatus::CLOSED;
    position.exit_price = exit_price;
    position.exit_reason = reason;
    position.closed_at = closed_at;
    position.realized_pnl = position.pnlAt(exit_price);

    state.open_positions.erase(it);
    state.risk.per_symbol_position_flag[symbol] = false;
    state.risk.portfolio_position_count = static_cast<int>(state.open_positions.size());
    state.risk.current_balance += position.realized_pnl;

    state.closed_positions.push_back(position);
    const size_t limit = static_cast<size_t>(std::max(1, config_.closed_history_limit));
    if (state.closed_positions.size() > limit) {
        state.closed_positions.erase(
            state.closed_positions.begin(),
            state.closed_positions.begin() + static_cast<std::ptrdiff_t>(state.closed_positions.size() - limit));
    }

    LOG_INFO("Position closed: {} {} @ {:.8f} ({}) PnL {:.2f}, balance {:.2f}",
             symbol, directionToString(position.direction), exit_price,
             exitReasonToString(reason), position.realized_pnl, state.risk.current_balance);

    updateDailyLossGuard(state.risk);
    return position;
}

} // namespace risk
} // namespace gapswing

#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace gapswing;
using namespace gapswing::risk;
using gapswing::strategy::RejectReason;
using gapswing::strategy::Signal;

namespace {
constexpr long long kDay = 24LL * 60 * 60 * 1000;
constexpr long long kT0 = 1699920000000LL;      // 2023-11-14 00:00 UTC

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

Signal makeSignal(const std::string& symbol, Direction direction, double entry, double stop, double tp) {
    Signal s;
    s.symbol = symbol;
    s.direction = direction;
    s.entry_price = entry;
    s.stop_loss = stop;
    s.take_profit = tp;
    s.gap_ref = symbol + "-gap";
    s.timestamp = kT0;
    return s;
}

SymbolMeta meta(double step, double min_size, double min_notional) {
    SymbolMeta m;
    m.size_step = step;
    m.min_order_size = min_size;
    m.min_notional = min_notional;
    m.price_tick = 0.01;
    return m;
}

RiskState freshState(double balance) {
    RiskState state;
    state.day_start_balance = balance;
    state.current_balance = balance;
    state.last_reset_time = kT0;
    return state;
}

core::Fill fillFor(const Signal& s, double size) {
    core::Fill fill;
    fill.order_id = "paper-1";
    fill.symbol = s.symbol;
    fill.side = entrySide(s.direction);
    fill.price = s.entry_price;
    fill.size = size;
    fill.timestamp = kT0 + 1000;
    return fill;
}
}

int main() {
    const RiskConfig config;
    const RiskManager rm(config);

    // Sizing: exact and non-exact step rounding
    {
        auto decision = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104),
                                freshState(1000), meta(0.1, 0.1, 5));
        assert(decision.approved);
        assert(near(decision.size, 5.0));
        assert(near(decision.risk_amount, 10.0));
        assert(near(decision.notional, 500.0));

        auto odd = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 97, 106),
                           freshState(1000), meta(0.1, 0.1, 5));
        assert(odd.approved);
        assert(near(odd.size, 3.3));

        auto fine = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 97, 106),
                            freshState(1000), meta(0.001, 0.001, 5));
        assert(near(fine.size, 3.333));

        auto bear = rm.size(makeSignal("BTCUSDT", Direction::BEARISH, 100, 102, 96),
                            freshState(1000), meta(0.1, 0.1, 5));
        assert(bear.approved && near(bear.size, 5.0));
    }

    // Exchange minimums
    {
        auto small = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 50, 200),
                             freshState(1000), meta(0.1, 0.5, 5));
        assert(!small.approved);
        assert(small.reason == RejectReason::BELOW_MIN_SIZE);
        assert(!small.detail.empty());

        auto notional = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 1.0, 0.5, 2.0),
                                freshState(1000), meta(1.0, 1.0, 25));
        assert(!notional.approved);
        assert(notional.reason == RejectReason::BELOW_MIN_SIZE);
    }

    // Missing metadata falls back to the configured defaults
    {
        auto decision = rm.size(makeSignal("NEWUSDT", Direction::BULLISH, 100, 97, 106),
                                freshState(1000), std::nullopt);
        assert(decision.approved);
        assert(near(decision.meta.size_step, config.default_size_step));
        assert(near(decision.size, 3.333));
    }

    // Notional clamp
    {
        RiskConfig clamped = config;
        clamped.max_order_notional = 100.0;
        const RiskManager capped(clamped);
        auto decision = capped.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104),
                                    freshState(1000), meta(0.1, 0.1, 5));
        assert(decision.approved);
        assert(near(decision.size, 1.0));
    }

    // Caps come before sizing
    {
        RiskState state = freshState(1000);
        state.per_symbol_position_flag["BTCUSDT"] = true;
        auto flagged = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104), state, meta(0.1, 0.1, 5));
        assert(flagged.reason == RejectReason::POSITION_OPEN);

        state = freshState(1000);
        state.portfolio_position_count = config.max_concurrent_positions;
        auto full = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104), state, meta(0.1, 0.1, 5));
        assert(full.reason == RejectReason::PORTFOLIO_CAP);
    }

    // Daily loss guard boundary
    {
        RiskState state = freshState(1000);
        state.current_balance = 949.99;
        auto blocked = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104), state, meta(0.1, 0.1, 5));
        assert(!blocked.approved);
        assert(blocked.reason == RejectReason::DAILY_LOSS_GUARD);
        assert(rm.isDailyLossBreached(state));
        assert(rm.updateDailyLossGuard(state));
        assert(state.daily_loss_guard_triggered);
        assert(!rm.updateDailyLossGuard(state));

        RiskState edge = freshState(1000);
        edge.current_balance = 950.00;
        assert(!rm.isDailyLossBreached(edge));
        auto allowed = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104), edge, meta(0.1, 0.1, 5));
        assert(allowed.approved);

        // Latched until the next UTC day even if the balance recovers.
        state.current_balance = 1000.0;
        auto latched = rm.size(makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104), state, meta(0.1, 0.1, 5));
        assert(latched.reason == RejectReason::DAILY_LOSS_GUARD);

        state.current_balance = 949.99;
        assert(!rm.refreshTradingDay(state, kT0 + kDay - 1));
        assert(rm.refreshTradingDay(state, kT0 + kDay));
        assert(!state.daily_loss_guard_triggered);
        assert(near(state.day_start_balance, 949.99));
        assert(state.last_reset_time == kT0 + kDay);
    }

    // UTC day boundaries
    {
        assert(!RiskManager::isNewTradingDay(kT0, kT0 + kDay - 1));
        assert(RiskManager::isNewTradingDay(kT0 + kDay - 60000, kT0 + kDay + 60000));
        assert(!RiskManager::isNewTradingDay(kT0 + kDay, kT0 + kDay));
        assert(RiskManager::utcDayIndex(kT0) + 1 == RiskManager::utcDayIndex(kT0 + kDay));
    }

    // Open, bar exits with stop-loss priority, PnL
    {
        core::EngineState state;
        state.risk = freshState(1000);
        const auto signal = makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104);
        const Position& opened = rm.open(state, signal, fillFor(signal, 5.0));
        assert(opened.id == "BTCUSDT-" + std::to_string(kT0 + 1000));
        assert(opened.status == PositionStatus::OPEN);
        assert(state.risk.per_symbol_position_flag["BTCUSDT"]);
        assert(state.risk.portfolio_position_count == 1);

        bool threw = false;
        try {
            rm.open(state, signal, fillFor(signal, 5.0));
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        const Candle both(100, 105, 97, 101, 1, kT0 + 4 * 3600 * 1000LL);
        auto check = rm.checkExitBar(state.open_positions.at("BTCUSDT"), both);
        assert(check.triggered);
        assert(check.reason == ExitReason::STOP_LOSS);
        assert(check.exit_price == 98.0);

        const Candle quiet(100, 101, 99, 100.5, 1, kT0 + 4 * 3600 * 1000LL);
        assert(!rm.manageBar(state, "BTCUSDT", quiet, kT0 + 8 * 3600 * 1000LL, nullptr));
        assert(state.open_positions.at("BTCUSDT").last_checked_bar == quiet.open_time);

        const Candle target(101, 104.5, 100.5, 104, 1, kT0 + 8 * 3600 * 1000LL);
        auto closed = rm.manageBar(state, "BTCUSDT", target, kT0 + 12 * 3600 * 1000LL, nullptr);
        assert(closed.has_value());
        assert(closed->exit_reason == ExitReason::TAKE_PROFIT);
        assert(near(closed->exit_price, 104.0));
        assert(near(closed->realized_pnl, (104.0 - 100.0) * 5.0));
        assert(near(state.risk.current_balance, 1020.0));
        assert(!state.hasOpenPosition("BTCUSDT"));
        assert(!state.risk.per_symbol_position_flag["BTCUSDT"]);
        assert(state.risk.portfolio_position_count == 0);
        assert(state.closed_positions.size() == 1);
    }

    // Ticker exits, short PnL sign, failed exit keeps the position
    {
        core::EngineState state;
        state.risk = freshState(1000);
        const auto signal = makeSignal("ETHUSDT", Direction::BEARISH, 100, 102, 96);
        rm.open(state, signal, fillFor(signal, 2.0));

        assert(!rm.manage(state, "ETHUSDT", 99.0, kT0 + 2000, nullptr));

        auto refuse = [](const Position&, const ExitCheck&) -> std::optional<double> { return std::nullopt; };
        assert(!rm.manage(state, "ETHUSDT", 95.0, kT0 + 3000, refuse));
        assert(state.hasOpenPosition("ETHUSDT"));

        auto slipped = [](const Position&, const ExitCheck&) -> std::optional<double> { return 95.5; };
        auto closed = rm.manage(state, "ETHUSDT", 95.0, kT0 + 4000, slipped);
        assert(closed.has_value());
        assert(closed->exit_reason == ExitReason::TAKE_PROFIT);
        assert(near(closed->realized_pnl, (95.5 - 100.0) * 2.0 * -1.0));
        assert(near(state.risk.current_balance, 1009.0));
    }

    // Break-even stop
    {
        RiskConfig be_config = config;
        be_config.breakeven_at_r = 1.0;
        const RiskManager be(be_config);
        core::EngineState state;
        state.risk = freshState(1000);
        const auto signal = makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104);
        be.open(state, signal, fillFor(signal, 5.0));

        assert(!be.manage(state, "BTCUSDT", 101.5, kT0 + 2000, nullptr));
        assert(near(state.open_positions.at("BTCUSDT").stop_loss, 98.0));
        assert(!be.manage(state, "BTCUSDT", 102.0, kT0 + 3000, nullptr));
        assert(near(state.open_positions.at("BTCUSDT").stop_loss, 100.0));
        assert(near(state.open_positions.at("BTCUSDT").riskPerUnit(), 2.0));

        auto closed = be.manage(state, "BTCUSDT", 100.0, kT0 + 4000, nullptr);
        assert(closed && closed->exit_reason == ExitReason::STOP_LOSS);
        assert(near(closed->realized_pnl, 0.0));
    }

    // Forced close, bounded history, loss trips the guard
    {
        RiskConfig small_history = config;
        small_history.closed_history_limit = 2;
        const RiskManager rm2(small_history);
        core::EngineState state;
        state.risk = freshState(1000);
        for (int i = 0; i < 3; ++i) {
            const auto signal = makeSignal("BTCUSDT", Direction::BULLISH, 100, 98, 104);
            rm2.open(state, signal, fillFor(signal, 10.0));
            auto closed = rm2.forceClose(state, "BTCUSDT", 98.0, ExitReason::FORCED, kT0 + 5000 + i, nullptr);
            assert(closed && closed->exit_reason == ExitReason::FORCED);
        }
        assert(state.closed_positions.size() == 2);
        assert(near(state.risk.current_balance, 940.0));
        assert(state.risk.daily_loss_guard_triggered);

        assert(!rm2.forceClose(state, "BTCUSDT", 98.0, ExitReason::MANUAL, kT0, nullptr));
        bool threw = false;
        try {
            rm2.close(state, "BTCUSDT", 98.0, ExitReason::MANUAL, kT0);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}

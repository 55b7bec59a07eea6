#pragma once

namespace gapswing {
namespace risk {

struct RiskConfig {
    double risk_per_trade_pct = 0.01;       // fraction of balance risked per trade
    double max_daily_loss_pct = 0.05;       // drawdown from day start that halts entries
    int max_concurrent_positions = 5;
    double max_order_notional = 0.0;        // 0 = unlimited
    double breakeven_at_r = 0.0;            // 0 = disabled
    int closed_history_limit = 200;

    // Used when the exchange has no metadata for a symbol.
    double default_min_order_size = 0.001;
    double default_min_notional = 5.0;
    double default_size_step = 0.001;
    double default_price_tick = 0.01;
};

} // namespace risk
} // namespace gapswing

#pragma once

#include <string>

namespace signalforge {
namespace backtest {

enum class SizingMode {
    RISK,       // risk_per_trade * leverage / entry_price
    FIXED       // fixed_size units per trade
};

struct BacktestConfig {
    double initial_balance = 10.0;
    double leverage = 50.0;
    double risk_per_trade = 0.02;
    SizingMode sizing_mode = SizingMode::RISK;
    double fixed_size = 1.0;

    int warmup_bars = 200;          // primary (5m) bars before the first decision
    int higher_tf_bars = 60;        // trailing bars kept for 15m/1h/4h windows
    int max_workers = 0;            // 0 = hardware concurrency
};

std::string sizingModeToString(SizingMode mode);
SizingMode sizingModeFromString(const std::string& s);

} // namespace backtest
} // namespace signalforge

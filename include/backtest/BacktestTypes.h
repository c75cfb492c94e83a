#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"

namespace signalforge {
namespace backtest {

struct EquityPoint {
    Timestamp timestamp = 0;
    double balance = 0.0;
};

enum class SymbolStatus {
    COMPLETED,
    SKIPPED,        // not enough warm-up or higher-timeframe data
    FAILED,         // data access error
    CANCELLED
};

struct SymbolReport {
    std::string symbol;
    SymbolStatus status = SymbolStatus::COMPLETED;
    std::string message;
    size_t candles_processed = 0;
    int trades = 0;
    bool open_position_at_end = false;
};

struct BacktestResults {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double average_pnl = 0.0;
    double max_drawdown = 0.0;
    double final_balance = 0.0;
    double sharpe_ratio = 0.0;

    double total_pnl = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;        // absolute value
    double profit_factor = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;          // absolute value
    std::map<std::string, int> exit_reason_counts;

    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    std::vector<SymbolReport> symbol_reports;
    bool cancelled = false;
};

std::string symbolStatusToString(SymbolStatus status);

nlohmann::json toJson(const Trade& trade);
nlohmann::json toJson(const SymbolReport& report);
nlohmann::json toJson(const BacktestResults& results);

} // namespace backtest
} // namespace signalforge

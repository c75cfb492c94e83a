#include "backtest/PerformanceMetrics.h"

#include <cmath>
#include <iostream>

using namespace signalforge;
using namespace signalforge::backtest;

namespace {
Trade closedTrade(const std::string& symbol, Timestamp open_time, Timestamp close_time,
                  double pnl, ExitReason reason) {
    Trade t;
    t.symbol = symbol;
    t.open_time = open_time;
    t.close_time = close_time;
    t.status = PositionStatus::CLOSED;
    t.pnl = pnl;
    t.exit_reason = reason;
    return t;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
}

int main() {
    // Zero-variance returns give a zero Sharpe ratio
    if (PerformanceMetrics::calculateSharpeRatio({0.25, 0.25, 0.25}) != 0.0) {
        std::cerr << "[TEST] constant returns should give Sharpe 0\n";
        return 1;
    }
    if (PerformanceMetrics::calculateSharpeRatio({0.05}) != 0.0) {
        std::cerr << "[TEST] single return should give Sharpe 0\n";
        return 1;
    }
    // mean 0.02, sample stdev 0.01414..., annualized by sqrt(252)
    const double sharpe = PerformanceMetrics::calculateSharpeRatio({0.01, 0.03});
    const double expected = 0.02 * 252.0 / (std::sqrt(0.0002) * std::sqrt(252.0));
    if (!near(sharpe, expected)) {
        std::cerr << "[TEST] unexpected Sharpe: " << sharpe << " vs " << expected << "\n";
        return 1;
    }

    // Four trades each earning 10% of the running balance
    std::vector<Trade> compounding;
    double running = 10.0;
    for (int i = 0; i < 4; ++i) {
        const double pnl = running * 0.1;
        running += pnl;
        compounding.push_back(closedTrade("BTCUSDT", 100 * i, 100 * i + 50, pnl, ExitReason::TAKE_PROFIT));
    }
    const BacktestResults steady = PerformanceMetrics::aggregate(compounding, 10.0);
    if (steady.sharpe_ratio != 0.0) {
        std::cerr << "[TEST] constant compounding returns should give Sharpe 0, got "
                  << steady.sharpe_ratio << "\n";
        return 1;
    }
    if (!near(steady.final_balance, running)) {
        std::cerr << "[TEST] compounding final balance mismatch\n";
        return 1;
    }

    // Ordering: close time, then symbol
    std::vector<Trade> trades = {
        closedTrade("ETHUSDT", 100, 300, -1.0, ExitReason::STOP_LOSS),
        closedTrade("BTCUSDT", 200, 300, 3.0, ExitReason::TAKE_PROFIT),
        closedTrade("BTCUSDT", 50, 150, 2.0, ExitReason::TAKE_PROFIT),
        closedTrade("SOLUSDT", 400, 500, 0.0, ExitReason::REVERSAL)
    };
    std::vector<Trade> sorted = trades;
    PerformanceMetrics::sortTrades(sorted);
    if (sorted[0].close_time != 150 || sorted[1].symbol != "BTCUSDT" || sorted[2].symbol != "ETHUSDT") {
        std::cerr << "[TEST] trades not sorted by close time then symbol\n";
        return 1;
    }

    const BacktestResults results = PerformanceMetrics::aggregate(trades, 10.0);
    if (results.total_trades != 4 || results.winning_trades != 2 || results.losing_trades != 2) {
        std::cerr << "[TEST] unexpected counts: " << results.total_trades << "/"
                  << results.winning_trades << "/" << results.losing_trades << "\n";
        return 1;
    }
    if (!near(results.win_rate, 0.5) || !near(results.average_pnl, 1.0) || !near(results.total_pnl, 4.0)) {
        std::cerr << "[TEST] unexpected win rate or pnl\n";
        return 1;
    }
    if (!near(results.final_balance, 14.0)) {
        std::cerr << "[TEST] final balance should be 14, got " << results.final_balance << "\n";
        return 1;
    }
    if (!near(results.profit_factor, 5.0) || !near(results.avg_win, 2.5) || !near(results.avg_loss, 0.5)) {
        std::cerr << "[TEST] unexpected profit factor or averages\n";
        return 1;
    }
    // Equity 12 -> 15 -> 14 -> 14: drawdown from the 15 peak
    if (results.equity_curve.size() != 4 || !near(results.max_drawdown, 1.0 / 15.0)) {
        std::cerr << "[TEST] unexpected drawdown: " << results.max_drawdown << "\n";
        return 1;
    }
    if (results.max_drawdown < 0.0) {
        std::cerr << "[TEST] drawdown must be non-negative\n";
        return 1;
    }
    if (results.exit_reason_counts.at("take_profit") != 2 ||
        results.exit_reason_counts.at("stop_loss") != 1 ||
        results.exit_reason_counts.at("reversal") != 1) {
        std::cerr << "[TEST] unexpected exit reason counts\n";
        return 1;
    }

    // Empty run
    const BacktestResults empty = PerformanceMetrics::aggregate({}, 10.0);
    if (empty.total_trades != 0 || empty.win_rate != 0.0 || empty.final_balance != 10.0 ||
        empty.max_drawdown != 0.0 || empty.sharpe_ratio != 0.0) {
        std::cerr << "[TEST] empty aggregate should be neutral\n";
        return 1;
    }

    // Steps from a non-positive balance are skipped
    std::vector<EquityPoint> curve(3);
    curve[0].balance = -1.0;
    curve[1].balance = 2.0;
    curve[2].balance = 3.0;
    if (PerformanceMetrics::calculateReturns(curve).size() != 1) {
        std::cerr << "[TEST] returns from a negative balance should be skipped\n";
        return 1;
    }

    std::cout << "[TEST] PerformanceMetrics PASSED\n";
    return 0;
}

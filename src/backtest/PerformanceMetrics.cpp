#include "backtest/PerformanceMetrics.h"

#include <algorithm>
#include <cmath>

namespace signalforge {
namespace backtest {

namespace {
constexpr double TRADING_DAYS = 252.0;

struct TradeStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
};

void accumulateStats(TradeStats& s, const Trade& trade) {
    s.trades++;
    s.net_profit += trade.pnl;
    if (trade.pnl > 0.0) {
        s.wins++;
        s.gross_profit += trade.pnl;
    } else {
        s.gross_loss_abs += std::abs(trade.pnl);
    }
}
}

void PerformanceMetrics::sortTrades(std::vector<Trade>& trades) {
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        const Timestamp a_close = a.close_time.value_or(a.open_time);
        const Timestamp b_close = b.close_time.value_or(b.open_time);
        if (a_close != b_close) return a_close < b_close;
        if (a.symbol != b.symbol) return a.symbol < b.symbol;
        return a.open_time < b.open_time;
    });
}

std::vector<EquityPoint> PerformanceMetrics::buildEquityCurve(const std::vector<Trade>& trades, double initial_balance) {
    std::vector<EquityPoint> curve;
    curve.reserve(trades.size());

    double balance = initial_balance;
    for (const auto& trade : trades) {
        balance += trade.pnl;
        EquityPoint point;
        point.timestamp = trade.close_time.value_or(trade.open_time);
        point.balance = balance;
        curve.push_back(point);
    }
    return curve;
}

double PerformanceMetrics::calculateMaxDrawdown(const std::vector<EquityPoint>& curve, double initial_balance) {
    double max_drawdown = 0.0;
    double peak = initial_balance;

    for (const auto& point : curve) {
        if (point.balance > peak) {
            peak = point.balance;
        }
        if (peak > 0.0) {
            max_drawdown = std::max(max_drawdown, (peak - point.balance) / peak);
        }
    }
    return max_drawdown;
}

std::vector<double> PerformanceMetrics::calculateReturns(const std::vector<EquityPoint>& curve) {
    std::vector<double> returns;
    for (size_t i = 1; i < curve.size(); ++i) {
        const double prev = curve[i - 1].balance;
        if (prev <= 0.0) {
            continue;
        }
        returns.push_back((curve[i].balance - prev) / prev);
    }
    return returns;
}

double PerformanceMetrics::calculateSharpeRatio(const std::vector<double>& returns) {
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());

    double variance = 0.0;
    for (double r : returns) variance += (r - mean) * (r - mean);
    variance /= static_cast<double>(returns.size() - 1);

    // Near-zero stdev counts as zero variance
    const double std_dev = std::sqrt(variance);
    if (std_dev <= 1e-12 * std::max(1.0, std::abs(mean))) {
        return 0.0;
    }

    return (mean * TRADING_DAYS) / (std_dev * std::sqrt(TRADING_DAYS));
}

BacktestResults PerformanceMetrics::aggregate(std::vector<Trade> trades, double initial_balance) {
    BacktestResults results;
    sortTrades(trades);

    TradeStats stats;
    for (const auto& trade : trades) {
        accumulateStats(stats, trade);
        results.exit_reason_counts[exitReasonToString(trade.exit_reason)]++;
    }

    results.total_trades = stats.trades;
    results.winning_trades = stats.wins;
    results.losing_trades = stats.trades - stats.wins;
    results.win_rate = stats.winRate();
    results.average_pnl = stats.expectancy();
    results.total_pnl = stats.net_profit;
    results.gross_profit = stats.gross_profit;
    results.gross_loss = stats.gross_loss_abs;
    results.profit_factor = stats.profitFactor();
    results.avg_win = (results.winning_trades > 0) ? stats.gross_profit / results.winning_trades : 0.0;
    results.avg_loss = (results.losing_trades > 0) ? stats.gross_loss_abs / results.losing_trades : 0.0;

    results.equity_curve = buildEquityCurve(trades, initial_balance);
    results.final_balance = results.equity_curve.empty() ? initial_balance : results.equity_curve.back().balance;
    results.max_drawdown = calculateMaxDrawdown(results.equity_curve, initial_balance);
    results.sharpe_ratio = calculateSharpeRatio(calculateReturns(results.equity_curve));
    results.trades = std::move(trades);

    return results;
}

} // namespace backtest
} // namespace signalforge

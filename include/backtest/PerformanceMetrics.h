#pragma once

#include <vector>
#include "backtest/BacktestTypes.h"

namespace signalforge {
namespace backtest {

class PerformanceMetrics {
public:
    // Orders closed trades by close time, then symbol, then open time.
    static void sortTrades(std::vector<Trade>& trades);

    // Replays trades (already sorted) from initial_balance, one point per close.
    static std::vector<EquityPoint> buildEquityCurve(const std::vector<Trade>& trades, double initial_balance);

    // Largest (peak - balance) / peak; the peak starts at initial_balance.
    static double calculateMaxDrawdown(const std::vector<EquityPoint>& curve, double initial_balance);

    // Step returns between consecutive curve points. Steps from a
    // non-positive balance are skipped.
    static std::vector<double> calculateReturns(const std::vector<EquityPoint>& curve);

    // mean * 252 / (sample stdev * sqrt(252)). Zero with fewer than two
    // returns or zero variance.
    static double calculateSharpeRatio(const std::vector<double>& returns);

    // Full statistics over the merged trade set.
    static BacktestResults aggregate(std::vector<Trade> trades, double initial_balance);
};

} // namespace backtest
} // namespace signalforge

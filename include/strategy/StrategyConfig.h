#pragma once

namespace signalforge {
namespace strategy {

// Shared by the long and short evaluators. Passed by value and never
// modified after construction.
struct DirectionalStrategyConfig {
    // Profit/Loss (fraction of entry price)
    double target_profit = 0.01;
    double stop_loss = 0.006;

    double min_confidence = 0.7;

    // Fusion weights, sum to 1
    double volume_weight = 0.30;
    double technical_weight = 0.35;
    double price_weight = 0.35;

    // Setup thresholds
    double min_volume_ratio = 0.45;
    double rsi_lower = 25.0;
    double rsi_upper = 75.0;

    // Confidence modifiers
    double volume_boost_ratio = 2.0;
    double high_volatility = 0.8;
};

struct StrategyManagerConfig {
    double reversal_delta = 0.1;
};

} // namespace strategy
} // namespace signalforge

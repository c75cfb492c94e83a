#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <memory>

namespace signalforge {
namespace strategy {

// Chooses between the long and short evaluators. With a position open only
// the opposite side is evaluated and it must beat the position's confidence
// by reversal_delta.
class StrategyManager {
public:
    StrategyManager(const StrategyManagerConfig& config,
                    const DirectionalStrategyConfig& long_config,
                    const DirectionalStrategyConfig& short_config);

    StrategyManager(const StrategyManagerConfig& config,
                    std::unique_ptr<IStrategy> long_strategy,
                    std::unique_ptr<IStrategy> short_strategy);

    // position may be null (flat)
    StrategyResult analyze(const Position* position, const MultiTimeframeCandles& candles) const;

    const StrategyManagerConfig& getConfig() const { return config_; }

private:
    StrategyResult analyzeNewPosition(const MultiTimeframeCandles& candles) const;
    StrategyResult analyzeReversal(const Position& position, const MultiTimeframeCandles& candles) const;
    StrategyResult runStrategy(const IStrategy& strategy, const MultiTimeframeCandles& candles) const;

    StrategyManagerConfig config_;
    std::unique_ptr<IStrategy> long_strategy_;
    std::unique_ptr<IStrategy> short_strategy_;
};

} // namespace strategy
} // namespace signalforge

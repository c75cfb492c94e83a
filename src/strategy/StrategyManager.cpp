#include "strategy/StrategyManager.h"
#include "strategy/LongStrategy.h"
#include "strategy/ShortStrategy.h"
#include "common/Logger.h"
#include <stdexcept>

namespace signalforge {
namespace strategy {

StrategyManager::StrategyManager(const StrategyManagerConfig& config,
                                 const DirectionalStrategyConfig& long_config,
                                 const DirectionalStrategyConfig& short_config)
    : StrategyManager(config,
                      std::make_unique<LongStrategy>(long_config),
                      std::make_unique<ShortStrategy>(short_config))
{
}

StrategyManager::StrategyManager(const StrategyManagerConfig& config,
                                 std::unique_ptr<IStrategy> long_strategy,
                                 std::unique_ptr<IStrategy> short_strategy)
    : config_(config)
    , long_strategy_(std::move(long_strategy))
    , short_strategy_(std::move(short_strategy))
{
    if (!long_strategy_ || !short_strategy_) {
        throw std::invalid_argument("StrategyManager requires both long and short strategies");
    }
    LOG_DEBUG("StrategyManager initialized (reversal delta {:.3f})", config_.reversal_delta);
}

StrategyResult StrategyManager::analyze(const Position* position, const MultiTimeframeCandles& candles) const {
    if (position == nullptr || !position->isOpen()) {
        return analyzeNewPosition(candles);
    }
    return analyzeReversal(*position, candles);
}

StrategyResult StrategyManager::analyzeNewPosition(const MultiTimeframeCandles& candles) const {
    StrategyResult long_result = runStrategy(*long_strategy_, candles);
    StrategyResult short_result = runStrategy(*short_strategy_, candles);

    if (!long_result.is_valid && !short_result.is_valid) {
        return StrategyResult::invalid("no valid setup found");
    }

    if (long_result.is_valid && short_result.is_valid) {
        // Ties go to long
        return (long_result.confidence >= short_result.confidence) ? long_result : short_result;
    }

    return long_result.is_valid ? long_result : short_result;
}

StrategyResult StrategyManager::analyzeReversal(const Position& position, const MultiTimeframeCandles& candles) const {
    const IStrategy& opposite_side = (position.side == Direction::LONG) ? *short_strategy_ : *long_strategy_;
    StrategyResult result = runStrategy(opposite_side, candles);

    if (!result.is_valid) {
        return StrategyResult::invalid("no reversal setup found");
    }

    if (result.confidence > position.confidence + config_.reversal_delta) {
        LOG_DEBUG("{} reversal {} -> {} (confidence {:.3f} vs {:.3f})",
                  position.symbol, directionToString(position.side),
                  directionToString(result.direction), result.confidence, position.confidence);
        return result;
    }

    return StrategyResult::invalid("insufficient confidence for reversal");
}

StrategyResult StrategyManager::runStrategy(const IStrategy& strategy, const MultiTimeframeCandles& candles) const {
    try {
        return strategy.analyze(candles);
    } catch (const std::exception& e) {
        LOG_ERROR("Strategy execution exception ({}): {}", strategy.getName(), e.what());
        return StrategyResult::invalid("strategy error");
    }
}

} // namespace strategy
} // namespace signalforge

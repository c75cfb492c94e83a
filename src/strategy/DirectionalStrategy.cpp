#include "strategy/DirectionalStrategy.h"
#include "common/Logger.h"
#include <algorithm>

namespace signalforge {
namespace strategy {

DirectionalStrategy::DirectionalStrategy(const DirectionalStrategyConfig& config)
    : config_(config)
{
}

StrategyResult DirectionalStrategy::analyze(const MultiTimeframeCandles& candles) const {
    auto vol = volume_analyzer_.analyze(candles);
    auto tech = technical_analyzer_.analyze(candles);
    auto price = price_analyzer_.analyze(candles);
    if (!vol || !tech || !price) {
        return StrategyResult::invalid("insufficient data");
    }

    if (!validateSetup(*vol, *tech, *price)) {
        return StrategyResult::invalid("conditions not met");
    }

    const double confidence = calculateConfidence(*vol, *tech, *price);
    if (confidence < config_.min_confidence) {
        LOG_DEBUG("[{}] low confidence {:.3f} < {:.3f}", getName(), confidence, config_.min_confidence);
        return StrategyResult::invalid("low confidence");
    }

    StrategyResult result;
    result.is_valid = true;
    result.direction = getDirection();
    result.confidence = confidence;
    result.entry_price = candles.m5.back().close;
    if (result.direction == Direction::LONG) {
        result.stop_loss = result.entry_price * (1.0 - config_.stop_loss);
        result.take_profit = result.entry_price * (1.0 + config_.target_profit);
    } else {
        result.stop_loss = result.entry_price * (1.0 + config_.stop_loss);
        result.take_profit = result.entry_price * (1.0 - config_.target_profit);
    }
    result.volume = vol;
    result.technical = tech;
    result.price = price;
    result.pattern = pattern_analyzer_.analyze(candles.m5);

    return result;
}

double DirectionalStrategy::calculateConfidence(const analytics::VolumeAnalysis& vol,
                                                const analytics::TechnicalAnalysis& tech,
                                                const analytics::PriceAnalysis& price) const {
    double confidence = vol.confidence * config_.volume_weight +
                        tech.confidence * config_.technical_weight +
                        price.confidence * config_.price_weight;

    if (vol.volume_ratio > config_.volume_boost_ratio) {
        confidence *= 1.1;
    }
    if (momentumConfirms(tech)) {
        confidence *= 1.1;
    }
    if (price.volatility > config_.high_volatility) {
        confidence *= 0.9;
    }

    return std::clamp(confidence, 0.0, 1.0);
}

bool DirectionalStrategy::rsiInBand(const analytics::TechnicalAnalysis& tech) const {
    return tech.rsi.value > config_.rsi_lower && tech.rsi.value < config_.rsi_upper;
}

} // namespace strategy
} // namespace signalforge

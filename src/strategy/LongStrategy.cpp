#include "strategy/LongStrategy.h"

namespace signalforge {
namespace strategy {

LongStrategy::LongStrategy(const DirectionalStrategyConfig& config)
    : DirectionalStrategy(config)
{
}

bool LongStrategy::validateSetup(const analytics::VolumeAnalysis& vol,
                                 const analytics::TechnicalAnalysis& tech,
                                 const analytics::PriceAnalysis& price) const {
    const bool trend_ok = tech.ema.direction >= 0 || tech.ema.slope > 0;
    const bool volume_ok = vol.volume_ratio > config_.min_volume_ratio;
    const bool price_ok = price.signal >= 0;

    return rsiInBand(tech) && trend_ok && volume_ok && price_ok;
}

bool LongStrategy::momentumConfirms(const analytics::TechnicalAnalysis& tech) const {
    return tech.rsi.cross_above && tech.ema.direction > 0;
}

} // namespace strategy
} // namespace signalforge

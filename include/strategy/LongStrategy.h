#pragma once

#include "strategy/DirectionalStrategy.h"

namespace signalforge {
namespace strategy {

class LongStrategy : public DirectionalStrategy {
public:
    explicit LongStrategy(const DirectionalStrategyConfig& config = DirectionalStrategyConfig());

    std::string getName() const override { return "long"; }
    Direction getDirection() const override { return Direction::LONG; }

    bool validateSetup(const analytics::VolumeAnalysis& vol,
                       const analytics::TechnicalAnalysis& tech,
                       const analytics::PriceAnalysis& price) const override;

protected:
    bool momentumConfirms(const analytics::TechnicalAnalysis& tech) const override;
};

} // namespace strategy
} // namespace signalforge

#pragma once

#include "strategy/DirectionalStrategy.h"

namespace signalforge {
namespace strategy {

class ShortStrategy : public DirectionalStrategy {
public:
    explicit ShortStrategy(const DirectionalStrategyConfig& config = DirectionalStrategyConfig());

    std::string getName() const override { return "short"; }
    Direction getDirection() const override { return Direction::SHORT; }

    bool validateSetup(const analytics::VolumeAnalysis& vol,
                       const analytics::TechnicalAnalysis& tech,
                       const analytics::PriceAnalysis& price) const override;

protected:
    bool momentumConfirms(const analytics::TechnicalAnalysis& tech) const override;
};

} // namespace strategy
} // namespace signalforge

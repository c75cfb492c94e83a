#pragma once

#include "common/Types.h"
#include "analytics/AnalysisTypes.h"
#include <optional>
#include <string>

namespace signalforge {
namespace strategy {

// Trade proposal, or an invalid result carrying the reason.
struct StrategyResult {
    bool is_valid;
    Direction direction;
    double entry_price;
    double stop_loss;
    double take_profit;
    double confidence;
    std::string reason;             // set only when invalid

    std::optional<analytics::VolumeAnalysis> volume;
    std::optional<analytics::TechnicalAnalysis> technical;
    std::optional<analytics::PriceAnalysis> price;
    std::optional<analytics::PatternResult> pattern;

    StrategyResult()
        : is_valid(false)
        , direction(Direction::LONG)
        , entry_price(0.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , confidence(0.0)
    {}

    static StrategyResult invalid(const std::string& why) {
        StrategyResult r;
        r.reason = why;
        return r;
    }
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string getName() const = 0;
    virtual Direction getDirection() const = 0;

    // Never throws. Short or unusable input yields an invalid result.
    virtual StrategyResult analyze(const MultiTimeframeCandles& candles) const = 0;
};

} // namespace strategy
} // namespace signalforge

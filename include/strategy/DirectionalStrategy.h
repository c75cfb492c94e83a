#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/VolumeAnalyzer.h"
#include "analytics/TechnicalAnalyzer.h"
#include "analytics/PriceAnalyzer.h"
#include "analytics/PatternAnalyzer.h"

namespace signalforge {
namespace strategy {

// Fixed-weight fusion of the volume, technical and price analyzers.
// Subclasses supply the direction-specific setup checks.
class DirectionalStrategy : public IStrategy {
public:
    explicit DirectionalStrategy(const DirectionalStrategyConfig& config);

    StrategyResult analyze(const MultiTimeframeCandles& candles) const override;

    const DirectionalStrategyConfig& getConfig() const { return config_; }

    double calculateConfidence(const analytics::VolumeAnalysis& vol,
                               const analytics::TechnicalAnalysis& tech,
                               const analytics::PriceAnalysis& price) const;

    virtual bool validateSetup(const analytics::VolumeAnalysis& vol,
                               const analytics::TechnicalAnalysis& tech,
                               const analytics::PriceAnalysis& price) const = 0;

protected:
    // RSI crossed its signal line in the trade direction with the EMA trend agreeing
    virtual bool momentumConfirms(const analytics::TechnicalAnalysis& tech) const = 0;

    bool rsiInBand(const analytics::TechnicalAnalysis& tech) const;

    DirectionalStrategyConfig config_;

private:
    analytics::VolumeAnalyzer volume_analyzer_;
    analytics::TechnicalAnalyzer technical_analyzer_;
    analytics::PriceAnalyzer price_analyzer_;
    analytics::PatternAnalyzer pattern_analyzer_;
};

} // namespace strategy
} // namespace signalforge

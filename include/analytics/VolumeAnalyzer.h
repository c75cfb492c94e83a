#pragma once

#include "analytics/AnalysisTypes.h"
#include "common/Types.h"
#include <optional>
#include <vector>

namespace signalforge {
namespace analytics {

class VolumeAnalyzer {
public:
    VolumeAnalyzer() = default;

    // Blends 5m (12 bars), 15m (12 bars) and 1h (6 bars).
    // nullopt when any timeframe is shorter than its window.
    std::optional<VolumeAnalysis> analyze(const MultiTimeframeCandles& candles) const;

    static std::optional<VolumeAnalysis> analyzeTimeframe(const std::vector<Candle>& candles, size_t window);

    static double calculateConfidence(double volume_ratio, double trade_ratio,
                                      double avg_trade_size, double trend_strength);
};

} // namespace analytics
} // namespace signalforge

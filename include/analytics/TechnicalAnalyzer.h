#pragma once

#include "analytics/AnalysisTypes.h"
#include "common/Types.h"
#include <optional>
#include <vector>

namespace signalforge {
namespace analytics {

class TechnicalAnalyzer {
public:
    static constexpr int FAST_EMA = 8;
    static constexpr int SLOW_EMA = 21;
    static constexpr int RSI_PERIOD = 14;
    static constexpr int RSI_SIGNAL = 3;
    static constexpr size_t MIN_CANDLES = 22;

    TechnicalAnalyzer() = default;

    // Weighted over 5m/15m/1h/4h. nullopt when any timeframe has fewer
    // than MIN_CANDLES bars.
    std::optional<TechnicalAnalysis> analyze(const MultiTimeframeCandles& candles) const;

    static std::optional<TechnicalAnalysis> analyzeTimeframe(const std::vector<Candle>& candles);

    static double calculateConfidence(const EMAMetrics& ema, const RSIMetrics& rsi);
};

} // namespace analytics
} // namespace signalforge

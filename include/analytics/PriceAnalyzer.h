#pragma once

#include "analytics/AnalysisTypes.h"
#include "common/Types.h"
#include <optional>
#include <vector>

namespace signalforge {
namespace analytics {

class PriceAnalyzer {
public:
    PriceAnalyzer() = default;

    std::optional<PriceAnalysis> analyze(const MultiTimeframeCandles& candles) const;

    // Decayed mean of relative close changes over the trailing window.
    // Weight starts at 1 on the oldest pair and shrinks by 0.9 per step.
    static std::optional<double> calculateMomentum(const std::vector<Candle>& candles, size_t window);

    // Population stdev of relative close changes over the trailing window
    static std::optional<double> calculateVolatility(const std::vector<Candle>& candles, size_t window);

    static double calculateAlignment(double m5, double m15, double h1, double h4);
};

} // namespace analytics
} // namespace signalforge

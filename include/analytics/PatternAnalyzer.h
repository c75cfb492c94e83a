#pragma once

#include "analytics/AnalysisTypes.h"
#include "common/Types.h"
#include <optional>
#include <vector>

namespace signalforge {
namespace analytics {

// Candle pattern on the last three bars. At most one pattern is reported,
// three-bar structure first, then engulfing, then pin bar.
class PatternAnalyzer {
public:
    explicit PatternAnalyzer(double min_height = 0.001) : min_height_(min_height) {}

    std::optional<PatternResult> analyze(const std::vector<Candle>& candles) const;

    std::optional<PatternResult> checkThreeBar(const Candle& c2, const Candle& c1, const Candle& c0) const;
    std::optional<PatternResult> checkEngulfing(const Candle& prev, const Candle& curr) const;
    std::optional<PatternResult> checkPinbar(const Candle& candle) const;

private:
    double min_height_;
};

} // namespace analytics
} // namespace signalforge

#include "analytics/PatternAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace signalforge {
namespace analytics {

namespace {
PatternResult makePattern(PatternType type, int signal, double strength) {
    PatternResult p;
    p.type = type;
    p.signal = signal;
    p.strength = std::clamp(strength, 0.0, 1.0);
    return p;
}
}

std::string patternTypeToString(PatternType type) {
    switch (type) {
        case PatternType::HIGHER_LOWS: return "HigherLows";
        case PatternType::LOWER_HIGHS: return "LowerHighs";
        case PatternType::BULLISH_ENGULFING: return "BullishEngulfing";
        case PatternType::BEARISH_ENGULFING: return "BearishEngulfing";
        case PatternType::BULLISH_PINBAR: return "BullishPinbar";
        case PatternType::BEARISH_PINBAR: return "BearishPinbar";
        default: return "Unknown";
    }
}

std::optional<PatternResult> PatternAnalyzer::analyze(const std::vector<Candle>& candles) const {
    if (candles.size() < 3) {
        return std::nullopt;
    }

    const Candle& c2 = candles[candles.size() - 3];
    const Candle& c1 = candles[candles.size() - 2];
    const Candle& c0 = candles[candles.size() - 1];

    if (auto pattern = checkThreeBar(c2, c1, c0)) {
        return pattern;
    }
    if (auto pattern = checkEngulfing(c1, c0)) {
        return pattern;
    }
    return checkPinbar(c0);
}

std::optional<PatternResult> PatternAnalyzer::checkThreeBar(const Candle& c2, const Candle& c1, const Candle& c0) const {
    if (c0.low > c1.low && c1.low > c2.low && c2.low > 0.0) {
        const double strength = (c0.low - c2.low) / c2.low;
        return makePattern(PatternType::HIGHER_LOWS, 1, std::min(strength * 10.0, 1.0));
    }

    if (c0.high < c1.high && c1.high < c2.high && c2.high > 0.0) {
        const double strength = (c2.high - c0.high) / c2.high;
        return makePattern(PatternType::LOWER_HIGHS, -1, std::min(strength * 10.0, 1.0));
    }

    return std::nullopt;
}

std::optional<PatternResult> PatternAnalyzer::checkEngulfing(const Candle& prev, const Candle& curr) const {
    const double prev_body = std::abs(prev.close - prev.open);
    const double curr_body = std::abs(curr.close - curr.open);
    if (curr_body < min_height_) {
        return std::nullopt;
    }

    const double strength = (prev_body > 0.0) ? std::min(curr_body / prev_body, 1.0) : 1.0;

    if (curr.open < prev.close && curr.close > prev.open) {
        return makePattern(PatternType::BULLISH_ENGULFING, 1, strength);
    }
    if (curr.open > prev.close && curr.close < prev.open) {
        return makePattern(PatternType::BEARISH_ENGULFING, -1, strength);
    }

    return std::nullopt;
}

std::optional<PatternResult> PatternAnalyzer::checkPinbar(const Candle& candle) const {
    const double body = std::abs(candle.close - candle.open);
    const double upper_wick = candle.high - std::max(candle.open, candle.close);
    const double lower_wick = std::min(candle.open, candle.close) - candle.low;
    const double range = candle.high - candle.low;
    if (range < min_height_) {
        return std::nullopt;
    }

    if (lower_wick > range * 0.6 && body < range * 0.3) {
        return makePattern(PatternType::BULLISH_PINBAR, 1, lower_wick / range);
    }
    if (upper_wick > range * 0.6 && body < range * 0.3) {
        return makePattern(PatternType::BEARISH_PINBAR, -1, upper_wick / range);
    }

    return std::nullopt;
}

} // namespace analytics
} // namespace signalforge

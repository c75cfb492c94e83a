#pragma once

#include <string>
#include <optional>

namespace signalforge {
namespace analytics {

// Volume dimension (metrics from the 5m timeframe)
struct VolumeAnalysis {
    double volume_ratio = 0.0;      // current / weighted average
    double trade_ratio = 0.0;       // current / previous trade count
    long long trade_count = 0;
    double avg_trade_size = 0.0;
    double trend_strength = 0.0;    // share of volume upticks in the window
    int signal = 0;                 // 1 bullish, -1 bearish, 0 neutral
    double confidence = 0.0;        // 0-1
};

struct EMAMetrics {
    double fast = 0.0;      // EMA(8)
    double slow = 0.0;      // EMA(21)
    int direction = 0;      // sign(fast - slow)
    double slope = 0.0;     // relative change of the fast EMA on the last bar
    double strength = 0.0;  // min(|slope| * 100, 1)
};

struct RSIMetrics {
    double value = 50.0;
    double signal = 50.0;
    double histogram = 0.0;
    int trend = 0;          // sign(value - signal)
    double strength = 0.0;  // |value - 50| / 50
    int divergence = 0;
    bool cross_above = false;
    bool cross_below = false;
};

// EMA + RSI fusion. Reported metrics come from the 5m timeframe.
struct TechnicalAnalysis {
    int signal = 0;
    double confidence = 0.0;
    EMAMetrics ema;
    RSIMetrics rsi;
};

struct PriceAnalysis {
    double current = 0.0;
    double momentum = 0.0;      // weighted across timeframes
    double volatility = 0.0;
    double alignment = 0.0;
    int signal = 0;
    double confidence = 0.0;
};

enum class PatternType {
    HIGHER_LOWS,
    LOWER_HIGHS,
    BULLISH_ENGULFING,
    BEARISH_ENGULFING,
    BULLISH_PINBAR,
    BEARISH_PINBAR
};

struct PatternResult {
    PatternType type = PatternType::HIGHER_LOWS;
    int signal = 0;
    double strength = 0.0;
};

std::string patternTypeToString(PatternType type);

} // namespace analytics
} // namespace signalforge

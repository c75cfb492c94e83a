#include "analytics/VolumeAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace signalforge {
namespace analytics {

namespace {
constexpr double WEIGHT_5M = 0.35;
constexpr double WEIGHT_15M = 0.45;
constexpr double WEIGHT_1H = 0.20;

constexpr size_t WINDOW_5M = 12;
constexpr size_t WINDOW_15M = 12;
constexpr size_t WINDOW_1H = 6;

constexpr double RECENCY_BASE = 1.1;
constexpr double MIN_VOLUME_RATIO = 1.3;
constexpr double MIN_TRADE_RATIO = 1.2;
constexpr double TRADE_SIZE_SCALE = 1000.0;

double clip01(double v) {
    return std::clamp(v, 0.0, 1.0);
}
}

std::optional<VolumeAnalysis> VolumeAnalyzer::analyze(const MultiTimeframeCandles& candles) const {
    auto m5 = analyzeTimeframe(candles.m5, WINDOW_5M);
    auto m15 = analyzeTimeframe(candles.m15, WINDOW_15M);
    auto h1 = analyzeTimeframe(candles.h1, WINDOW_1H);
    if (!m5 || !m15 || !h1) {
        return std::nullopt;
    }

    VolumeAnalysis result = *m5;
    result.confidence = clip01(m5->confidence * WEIGHT_5M +
                               m15->confidence * WEIGHT_15M +
                               h1->confidence * WEIGHT_1H);

    // Direction of the spike bar, only when volume is elevated
    result.signal = 0;
    if (result.volume_ratio >= MIN_VOLUME_RATIO) {
        const Candle& bar = candles.m5.back();
        if (bar.close > bar.open) {
            result.signal = 1;
        } else if (bar.close < bar.open) {
            result.signal = -1;
        }
    }

    return result;
}

std::optional<VolumeAnalysis> VolumeAnalyzer::analyzeTimeframe(const std::vector<Candle>& candles, size_t window) {
    if (window < 2 || candles.size() < window) {
        return std::nullopt;
    }

    const auto first = candles.end() - static_cast<std::ptrdiff_t>(window);
    std::vector<Candle> recent(first, candles.end());
    const Candle& current = recent.back();
    const Candle& previous = recent[recent.size() - 2];

    // Volume upticks
    int upticks = 0;
    for (size_t i = 1; i < recent.size(); ++i) {
        if (recent[i].volume > recent[i - 1].volume) {
            upticks++;
        }
    }

    // Recency-weighted average, oldest bar weight 1
    double weighted_volume = 0.0;
    double total_weight = 0.0;
    for (size_t i = 0; i < recent.size(); ++i) {
        const double weight = std::pow(RECENCY_BASE, static_cast<double>(i));
        weighted_volume += recent[i].volume * weight;
        total_weight += weight;
    }
    const double avg_volume = weighted_volume / total_weight;

    VolumeAnalysis result;
    result.trend_strength = static_cast<double>(upticks) / static_cast<double>(recent.size() - 1);
    result.volume_ratio = (avg_volume > 0.0) ? current.volume / avg_volume : 0.0;
    result.trade_ratio = (previous.trade_count > 0)
        ? static_cast<double>(current.trade_count) / static_cast<double>(previous.trade_count)
        : 0.0;
    result.trade_count = current.trade_count;
    result.avg_trade_size = (current.trade_count > 0)
        ? current.volume / static_cast<double>(current.trade_count)
        : 0.0;
    result.confidence = calculateConfidence(result.volume_ratio, result.trade_ratio,
                                            result.avg_trade_size, result.trend_strength);
    return result;
}

double VolumeAnalyzer::calculateConfidence(double volume_ratio, double trade_ratio,
                                           double avg_trade_size, double trend_strength) {
    const double vol_component = clip01((volume_ratio - MIN_VOLUME_RATIO) / (2.0 - MIN_VOLUME_RATIO));
    const double trade_component = clip01((trade_ratio - MIN_TRADE_RATIO) / (2.0 - MIN_TRADE_RATIO));
    const double size_component = clip01(avg_trade_size / TRADE_SIZE_SCALE);
    const double trend_component = clip01(trend_strength);

    return clip01(vol_component * 0.4 + trade_component * 0.2 +
                  size_component * 0.1 + trend_component * 0.3);
}

} // namespace analytics
} // namespace signalforge

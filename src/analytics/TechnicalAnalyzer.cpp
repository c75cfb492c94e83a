#include "analytics/TechnicalAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace signalforge {
namespace analytics {

namespace {
constexpr double WEIGHT_5M = 0.30;
constexpr double WEIGHT_15M = 0.35;
constexpr double WEIGHT_1H = 0.20;
constexpr double WEIGHT_4H = 0.15;

constexpr double SIGNAL_THRESHOLD = 0.2;

int sign(double v) {
    if (v > 0) return 1;
    if (v < 0) return -1;
    return 0;
}
}

std::optional<TechnicalAnalysis> TechnicalAnalyzer::analyze(const MultiTimeframeCandles& candles) const {
    auto m5 = analyzeTimeframe(candles.m5);
    auto m15 = analyzeTimeframe(candles.m15);
    auto h1 = analyzeTimeframe(candles.h1);
    auto h4 = analyzeTimeframe(candles.h4);
    if (!m5 || !m15 || !h1 || !h4) {
        return std::nullopt;
    }

    const double weighted_signal = m5->signal * WEIGHT_5M + m15->signal * WEIGHT_15M +
                                   h1->signal * WEIGHT_1H + h4->signal * WEIGHT_4H;

    TechnicalAnalysis result;
    result.ema = m5->ema;
    result.rsi = m5->rsi;
    if (weighted_signal > SIGNAL_THRESHOLD) {
        result.signal = 1;
    } else if (weighted_signal < -SIGNAL_THRESHOLD) {
        result.signal = -1;
    }
    result.confidence = std::clamp(m5->confidence * WEIGHT_5M + m15->confidence * WEIGHT_15M +
                                   h1->confidence * WEIGHT_1H + h4->confidence * WEIGHT_4H,
                                   0.0, 1.0);
    return result;
}

std::optional<TechnicalAnalysis> TechnicalAnalyzer::analyzeTimeframe(const std::vector<Candle>& candles) {
    if (candles.size() < MIN_CANDLES) {
        return std::nullopt;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const size_t last = closes.size() - 1;

    const auto ema_fast = TechnicalIndicators::calculateEMA(closes, FAST_EMA);
    const auto ema_slow = TechnicalIndicators::calculateEMA(closes, SLOW_EMA);
    const auto rsi = TechnicalIndicators::calculateRSI(closes, RSI_PERIOD, RSI_SIGNAL);

    if (ema_fast.empty() || ema_slow.empty() || !rsi.valid()) {
        return std::nullopt;
    }
    if (!ema_fast[last] || !ema_fast[last - 1] || !ema_slow[last] ||
        !rsi.rsi[last] || !rsi.rsi[last - 1] || !rsi.signal[last] || !rsi.signal[last - 1]) {
        return std::nullopt;
    }

    TechnicalAnalysis td;

    // EMA
    td.ema.fast = *ema_fast[last];
    td.ema.slow = *ema_slow[last];
    td.ema.direction = sign(td.ema.fast - td.ema.slow);
    const double prev_fast = *ema_fast[last - 1];
    td.ema.slope = (prev_fast != 0.0) ? (td.ema.fast - prev_fast) / prev_fast : 0.0;
    td.ema.strength = TechnicalIndicators::slopeStrength(td.ema.slope);

    // RSI
    const double curr_rsi = *rsi.rsi[last];
    const double prev_rsi = *rsi.rsi[last - 1];
    const double curr_signal = *rsi.signal[last];
    const double prev_signal = *rsi.signal[last - 1];

    td.rsi.value = curr_rsi;
    td.rsi.signal = curr_signal;
    td.rsi.histogram = curr_rsi - curr_signal;
    td.rsi.trend = sign(curr_rsi - curr_signal);
    td.rsi.strength = std::min(std::abs(curr_rsi - 50.0) / 50.0, 1.0);
    td.rsi.divergence = rsi.divergence[last];
    td.rsi.cross_above = prev_rsi <= prev_signal && curr_rsi > curr_signal;
    td.rsi.cross_below = prev_rsi >= prev_signal && curr_rsi < curr_signal;

    if (td.ema.direction > 0 && curr_rsi > 50.0) {
        td.signal = 1;
    } else if (td.ema.direction < 0 && curr_rsi < 50.0) {
        td.signal = -1;
    }
    td.confidence = calculateConfidence(td.ema, td.rsi);

    LOG_DEBUG("Technical: EMA8={:.4f} EMA21={:.4f} dir={} RSI={:.2f} signal={}",
              td.ema.fast, td.ema.slow, td.ema.direction, td.rsi.value, td.signal);

    return td;
}

double TechnicalAnalyzer::calculateConfidence(const EMAMetrics& ema, const RSIMetrics& rsi) {
    double confidence = 0.4 * ema.strength + 0.4 * std::min(std::abs(rsi.value - 50.0) / 50.0, 1.0);

    // RSI momentum agrees with the EMA trend
    if (ema.direction != 0 && rsi.trend == ema.direction) {
        confidence += 0.2;
    }

    // Neutral RSI zone
    if (rsi.value >= 45.0 && rsi.value <= 55.0) {
        confidence *= 0.8;
    }

    return std::clamp(confidence, 0.0, 1.0);
}

} // namespace analytics
} // namespace signalforge

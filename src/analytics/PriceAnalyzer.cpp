#include "analytics/PriceAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <initializer_list>

namespace signalforge {
namespace analytics {

namespace {
constexpr double WEIGHT_5M = 0.15;
constexpr double WEIGHT_15M = 0.25;
constexpr double WEIGHT_1H = 0.35;
constexpr double WEIGHT_4H = 0.25;

constexpr size_t WINDOW_5M = 12;
constexpr size_t WINDOW_15M = 12;
constexpr size_t WINDOW_1H = 6;
constexpr size_t WINDOW_4H = 6;
constexpr size_t VOLATILITY_WINDOW = 12;

constexpr double MOMENTUM_DECAY = 0.9;
constexpr double SIGNAL_THRESHOLD = 0.001;

std::vector<double> relativeChanges(const std::vector<Candle>& candles, size_t window) {
    std::vector<double> changes;
    const size_t begin = candles.size() - window;
    for (size_t i = begin + 1; i < candles.size(); ++i) {
        const double prev = candles[i - 1].close;
        changes.push_back(prev != 0.0 ? (candles[i].close - prev) / prev : 0.0);
    }
    return changes;
}

bool allPositive(std::initializer_list<double> values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return v > 0; });
}

bool allNegative(std::initializer_list<double> values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return v < 0; });
}
}

std::optional<PriceAnalysis> PriceAnalyzer::analyze(const MultiTimeframeCandles& candles) const {
    auto m5 = calculateMomentum(candles.m5, WINDOW_5M);
    auto m15 = calculateMomentum(candles.m15, WINDOW_15M);
    auto h1 = calculateMomentum(candles.h1, WINDOW_1H);
    auto h4 = calculateMomentum(candles.h4, WINDOW_4H);
    auto volatility = calculateVolatility(candles.m5, VOLATILITY_WINDOW);
    if (!m5 || !m15 || !h1 || !h4 || !volatility) {
        return std::nullopt;
    }

    PriceAnalysis result;
    result.current = candles.m5.back().close;
    result.momentum = *m5 * WEIGHT_5M + *m15 * WEIGHT_15M + *h1 * WEIGHT_1H + *h4 * WEIGHT_4H;
    result.volatility = *volatility;
    result.alignment = calculateAlignment(*m5, *m15, *h1, *h4);
    result.confidence = std::clamp(result.alignment * std::max(0.0, 1.0 - result.volatility), 0.0, 1.0);

    if (result.momentum > SIGNAL_THRESHOLD) {
        result.signal = 1;
    } else if (result.momentum < -SIGNAL_THRESHOLD) {
        result.signal = -1;
    }

    return result;
}

std::optional<double> PriceAnalyzer::calculateMomentum(const std::vector<Candle>& candles, size_t window) {
    if (window < 2 || candles.size() < window) {
        return std::nullopt;
    }

    double momentum = 0.0;
    double weight = 1.0;
    double total_weight = 0.0;
    for (double change : relativeChanges(candles, window)) {
        momentum += change * weight;
        total_weight += weight;
        weight *= MOMENTUM_DECAY;
    }

    return momentum / total_weight;
}

std::optional<double> PriceAnalyzer::calculateVolatility(const std::vector<Candle>& candles, size_t window) {
    if (window < 2 || candles.size() < window) {
        return std::nullopt;
    }

    const auto changes = relativeChanges(candles, window);
    const double mean = TechnicalIndicators::calculateMean(changes);
    return TechnicalIndicators::calculateStandardDeviation(changes, mean);
}

double PriceAnalyzer::calculateAlignment(double m5, double m15, double h1, double h4) {
    if (allPositive({m5, m15, h1, h4}) || allNegative({m5, m15, h1, h4})) {
        return 1.0;
    }
    if (allPositive({m15, h1, h4}) || allNegative({m15, h1, h4})) {
        return 0.8;
    }
    if (allPositive({h1, h4}) || allNegative({h1, h4})) {
        return 0.6;
    }
    return 0.0;
}

} // namespace analytics
} // namespace signalforge

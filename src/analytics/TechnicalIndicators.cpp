#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace signalforge {
namespace analytics {

namespace {
constexpr double SLOPE_DEAD_BAND = 0.0001;
constexpr int DIVERGENCE_LOOKBACK = 5;

double multiplier(int period) {
    return 2.0 / static_cast<double>(period + 1);
}

// EMA over the defined tail of `series`, mapped back onto its indices.
IndicatorSeries emaOfDefined(const IndicatorSeries& series, size_t first_defined, int period) {
    IndicatorSeries out(series.size());
    if (first_defined >= series.size()) {
        return out;
    }

    std::vector<double> compact;
    compact.reserve(series.size() - first_defined);
    for (size_t i = first_defined; i < series.size(); ++i) {
        compact.push_back(series[i].value_or(0.0));
    }

    const auto ema = TechnicalIndicators::calculateEMA(compact, period);
    for (size_t i = 0; i < ema.size(); ++i) {
        out[first_defined + i] = ema[i];
    }
    return out;
}
}

IndicatorSeries TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.empty() || prices.size() < static_cast<size_t>(period)) {
        return {};
    }

    IndicatorSeries ema(prices.size());
    const double k = multiplier(period);

    // Seed: simple mean of the first `period` prices
    double seed = std::accumulate(prices.begin(), prices.begin() + period, 0.0) / period;
    ema[period - 1] = seed;

    double prev = seed;
    for (size_t i = static_cast<size_t>(period); i < prices.size(); ++i) {
        prev = (prices[i] - prev) * k + prev;
        ema[i] = prev;
    }

    return ema;
}

double TechnicalIndicators::nextEMA(double price, double prev_ema, int period) {
    return (price - prev_ema) * multiplier(period) + prev_ema;
}

std::optional<TechnicalIndicators::EMAPoint> TechnicalIndicators::calculateEMAPoint(
    double price, double prev_ema, int period
) {
    if (period <= 0) {
        return std::nullopt;
    }

    EMAPoint point;
    point.value = nextEMA(price, prev_ema, period);
    point.slope = (prev_ema != 0.0) ? (point.value - prev_ema) / prev_ema : 0.0;
    point.direction = slopeDirection(point.slope);
    point.strength = slopeStrength(point.slope);
    return point;
}

int TechnicalIndicators::slopeDirection(double slope) {
    if (slope > SLOPE_DEAD_BAND) return 1;
    if (slope < -SLOPE_DEAD_BAND) return -1;
    return 0;
}

double TechnicalIndicators::slopeStrength(double slope) {
    return std::min(std::abs(slope) * 100.0, 1.0);
}

TechnicalIndicators::RSIResult TechnicalIndicators::calculateRSI(
    const std::vector<double>& prices, int period, int smooth_period
) {
    RSIResult result;
    if (period <= 0 || smooth_period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return result;
    }

    const size_t n = prices.size();
    std::vector<double> gains(n, 0.0);
    std::vector<double> losses(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) gains[i] = change;
        else losses[i] = -change;
    }

    const auto ema_gains = calculateEMA(gains, period);
    const auto ema_losses = calculateEMA(losses, period);

    result.rsi.assign(n, std::nullopt);
    for (size_t i = static_cast<size_t>(period); i < n; ++i) {
        const double avg_gain = ema_gains[i].value_or(0.0);
        const double avg_loss = ema_losses[i].value_or(0.0);
        if (avg_loss == 0.0) {
            result.rsi[i] = 100.0;
        } else {
            const double rs = avg_gain / avg_loss;
            result.rsi[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }

    // Signal line: EMA of the defined RSI values
    result.signal = emaOfDefined(result.rsi, static_cast<size_t>(period), smooth_period);

    result.histogram.assign(n, std::nullopt);
    for (size_t i = 0; i < n; ++i) {
        if (result.rsi[i] && result.signal[i]) {
            result.histogram[i] = *result.rsi[i] - *result.signal[i];
        }
    }

    result.divergence.assign(n, 0);
    for (size_t i = static_cast<size_t>(period) + DIVERGENCE_LOOKBACK; i < n; ++i) {
        const double price_delta = prices[i] - prices[i - DIVERGENCE_LOOKBACK];
        const double rsi_delta = *result.rsi[i] - *result.rsi[i - DIVERGENCE_LOOKBACK];
        if (price_delta < 0 && rsi_delta > 0) {
            result.divergence[i] = 1;
        } else if (price_delta > 0 && rsi_delta < 0) {
            result.divergence[i] = -1;
        }
    }

    return result;
}

std::optional<TechnicalIndicators::RSIPoint> TechnicalIndicators::calculateRSIPoint(
    double price, double prev_price, double prev_gain_ema, double prev_loss_ema, int period
) {
    if (period <= 0) {
        return std::nullopt;
    }

    const double change = price - prev_price;
    const double gain = (change > 0) ? change : 0.0;
    const double loss = (change < 0) ? -change : 0.0;

    RSIPoint point;
    point.gain_ema = nextEMA(gain, prev_gain_ema, period);
    point.loss_ema = nextEMA(loss, prev_loss_ema, period);
    if (point.loss_ema == 0.0) {
        point.rsi = 100.0;
    } else {
        const double rs = point.gain_ema / point.loss_ema;
        point.rsi = 100.0 - (100.0 / (1.0 + rs));
    }
    return point;
}

bool TechnicalIndicators::validateMACDPeriods(size_t length, int fast, int slow, int signal_period) {
    if (fast <= 0 || signal_period <= 0 || slow <= fast) {
        return false;
    }
    return length >= static_cast<size_t>(slow + signal_period - 1);
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    if (!validateMACDPeriods(prices.size(), fast, slow, signal_period)) {
        return result;
    }

    const auto fast_ema = calculateEMA(prices, fast);
    const auto slow_ema = calculateEMA(prices, slow);

    const size_t n = prices.size();
    result.macd.assign(n, std::nullopt);
    for (size_t i = static_cast<size_t>(slow - 1); i < n; ++i) {
        result.macd[i] = *fast_ema[i] - *slow_ema[i];
    }

    // Signal line runs over the defined MACD values only
    result.signal = emaOfDefined(result.macd, static_cast<size_t>(slow - 1), signal_period);

    result.histogram.assign(n, std::nullopt);
    for (size_t i = 0; i < n; ++i) {
        if (result.macd[i] && result.signal[i]) {
            result.histogram[i] = *result.macd[i] - *result.signal[i];
        }
    }

    return result;
}

std::optional<TechnicalIndicators::MACDPoint> TechnicalIndicators::calculateMACDPoint(
    double price, double prev_fast_ema, double prev_slow_ema, double prev_signal,
    int fast, int slow, int signal_period
) {
    if (fast <= 0 || signal_period <= 0 || slow <= fast) {
        return std::nullopt;
    }

    MACDPoint point;
    point.fast_ema = nextEMA(price, prev_fast_ema, fast);
    point.slow_ema = nextEMA(price, prev_slow_ema, slow);
    point.macd = point.fast_ema - point.slow_ema;
    point.signal = nextEMA(point.macd, prev_signal, signal_period);
    point.histogram = point.macd - point.signal;
    return point;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    const size_t n = prices.size();
    result.upper.assign(n, std::nullopt);
    result.middle.assign(n, std::nullopt);
    result.lower.assign(n, std::nullopt);
    result.width.assign(n, std::nullopt);

    for (size_t i = static_cast<size_t>(period - 1); i < n; ++i) {
        std::vector<double> window(prices.begin() + (i + 1 - period), prices.begin() + i + 1);
        const double mean = calculateMean(window);
        const double std_dev = calculateStandardDeviation(window, mean);

        result.middle[i] = mean;
        result.upper[i] = mean + std_dev_mult * std_dev;
        result.lower[i] = mean - std_dev_mult * std_dev;
        if (mean != 0.0) {
            result.width[i] = (*result.upper[i] - *result.lower[i]) / mean;
        }
    }

    return result;
}

std::optional<TechnicalIndicators::BollingerPoint> TechnicalIndicators::calculateBollingerPoint(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    std::vector<double> recent(prices.end() - period, prices.end());

    BollingerPoint point;
    point.middle = calculateMean(recent);
    const double std_dev = calculateStandardDeviation(recent, point.middle);
    point.upper = point.middle + std_dev * std_dev_mult;
    point.lower = point.middle - std_dev * std_dev_mult;
    point.width = (point.middle != 0.0) ? (point.upper - point.lower) / point.middle : 0.0;

    const double band = point.upper - point.lower;
    point.percent_b = (band > 0.0001) ? (current_price - point.lower) / band : 0.5;

    return point;
}

TechnicalIndicators::CrossSignal TechnicalIndicators::detectCrossover(
    const IndicatorSeries& fast, const IndicatorSeries& slow
) {
    CrossSignal result;
    if (fast.size() < 2 || slow.size() < 2) {
        return result;
    }

    const auto curr_fast = fast[fast.size() - 1];
    const auto prev_fast = fast[fast.size() - 2];
    const auto curr_slow = slow[slow.size() - 1];
    const auto prev_slow = slow[slow.size() - 2];
    if (!curr_fast || !prev_fast || !curr_slow || !prev_slow) {
        return result;
    }

    const bool bullish = *prev_fast <= *prev_slow && *curr_fast > *curr_slow;
    const bool bearish = *prev_fast >= *prev_slow && *curr_fast < *curr_slow;
    if (!bullish && !bearish) {
        return result;
    }

    result.crossed = true;
    result.direction = bullish ? 1 : -1;
    result.strength = (*curr_slow != 0.0) ? std::abs((*curr_fast - *curr_slow) / *curr_slow) : 0.0;
    return result;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    return std::accumulate(prices.end() - period, prices.end(), 0.0) / period;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

std::optional<double> TechnicalIndicators::latest(const IndicatorSeries& series) {
    if (series.empty()) {
        return std::nullopt;
    }
    return series.back();
}

std::optional<double> TechnicalIndicators::valueAt(const IndicatorSeries& series, size_t index) {
    if (index >= series.size()) {
        return std::nullopt;
    }
    return series[index];
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / values.size());
}

} // namespace analytics
} // namespace signalforge

#pragma once

#include <vector>
#include <optional>
#include "common/Types.h"

namespace signalforge {
namespace analytics {

// Values aligned index-for-index with the input prices. Indices before the
// lookback window hold no value. An empty series means the input was too
// short or a parameter was invalid.
using IndicatorSeries = std::vector<std::optional<double>>;

class TechnicalIndicators {
public:
    // EMA (Exponential Moving Average)
    // Seeded at period-1 with the SMA of the first `period` prices.
    static IndicatorSeries calculateEMA(const std::vector<double>& prices, int period);

    // Streaming update: one new EMA value from the previous one.
    struct EMAPoint {
        double value;
        double slope;       // (value - prev) / prev
        int direction;      // 1 up, -1 down, 0 flat
        double strength;    // 0-1

        EMAPoint() : value(0), slope(0), direction(0), strength(0) {}
    };
    static std::optional<EMAPoint> calculateEMAPoint(double price, double prev_ema, int period);
    static double nextEMA(double price, double prev_ema, int period);

    // Slope helpers shared with the technical analyzer
    static int slopeDirection(double slope);
    static double slopeStrength(double slope);

    // RSI (Relative Strength Index) from the EMA of gains and losses,
    // with an EMA-smoothed signal line and 5-candle divergence flags.
    struct RSIResult {
        IndicatorSeries rsi;
        IndicatorSeries signal;
        IndicatorSeries histogram;
        std::vector<int> divergence;    // +1 bullish, -1 bearish, 0 none

        bool valid() const { return !rsi.empty(); }
    };
    static RSIResult calculateRSI(const std::vector<double>& prices, int period = 14, int smooth_period = 3);

    struct RSIPoint {
        double rsi;
        double gain_ema;
        double loss_ema;

        RSIPoint() : rsi(50.0), gain_ema(0), loss_ema(0) {}
    };
    static std::optional<RSIPoint> calculateRSIPoint(double price, double prev_price,
                                                     double prev_gain_ema, double prev_loss_ema,
                                                     int period);

    // MACD (Moving Average Convergence Divergence)
    struct MACDResult {
        IndicatorSeries macd;
        IndicatorSeries signal;
        IndicatorSeries histogram;

        bool valid() const { return !macd.empty(); }
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    struct MACDPoint {
        double fast_ema;
        double slow_ema;
        double macd;
        double signal;
        double histogram;

        MACDPoint() : fast_ema(0), slow_ema(0), macd(0), signal(0), histogram(0) {}
    };
    static std::optional<MACDPoint> calculateMACDPoint(double price, double prev_fast_ema,
                                                       double prev_slow_ema, double prev_signal,
                                                       int fast = 12, int slow = 26, int signal_period = 9);
    static bool validateMACDPeriods(size_t length, int fast, int slow, int signal_period);

    // Bollinger Bands over a trailing window (population standard deviation)
    struct BollingerBands {
        IndicatorSeries upper;
        IndicatorSeries middle;
        IndicatorSeries lower;
        IndicatorSeries width;      // (upper - lower) / middle

        bool valid() const { return !middle.empty(); }
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    struct BollingerPoint {
        double upper;
        double middle;
        double lower;
        double width;
        double percent_b;   // where current_price sits inside the band, 0~1

        BollingerPoint() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    static std::optional<BollingerPoint> calculateBollingerPoint(const std::vector<double>& prices,
                                                                 double current_price,
                                                                 int period = 20,
                                                                 double std_dev_mult = 2.0);

    // Crossover of two aligned series on the last bar
    struct CrossSignal {
        bool crossed;
        int direction;      // 1 bullish, -1 bearish
        double strength;

        CrossSignal() : crossed(false), direction(0), strength(0) {}
    };
    static CrossSignal detectCrossover(const IndicatorSeries& fast, const IndicatorSeries& slow);

    static double calculateSMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    // Last defined value, or nothing when the tail is undefined
    static std::optional<double> latest(const IndicatorSeries& series);
    static std::optional<double> valueAt(const IndicatorSeries& series, size_t index);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace signalforge

#undef NDEBUG
#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using signalforge::analytics::TechnicalIndicators;
using signalforge::analytics::IndicatorSeries;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

void testEMA() {
    const std::vector<double> prices = {1, 2, 3, 4, 5};
    const auto ema = TechnicalIndicators::calculateEMA(prices, 3);
    assert(ema.size() == prices.size());
    assert(!ema[0] && !ema[1]);
    assert(ema[2] && near(*ema[2], 2.0));
    assert(ema[3] && near(*ema[3], 3.0));
    assert(ema[4] && near(*ema[4], 4.0));

    // Too short or non-positive period
    assert(TechnicalIndicators::calculateEMA({1, 2}, 3).empty());
    assert(TechnicalIndicators::calculateEMA(prices, 0).empty());

    const auto point = TechnicalIndicators::calculateEMAPoint(5.0, 3.0, 3);
    assert(point);
    assert(near(point->value, 4.0));
    assert(point->direction == 1);
    assert(near(point->strength, 1.0));
    assert(!TechnicalIndicators::calculateEMAPoint(5.0, 3.0, 0));

    assert(TechnicalIndicators::slopeDirection(0.00005) == 0);
    assert(TechnicalIndicators::slopeDirection(-0.001) == -1);
    assert(near(TechnicalIndicators::slopeStrength(0.002), 0.2));
    std::cout << "[TEST] EMA PASSED" << std::endl;
}

void testRSI() {
    std::vector<double> rising;
    for (int i = 1; i <= 10; ++i) rising.push_back(static_cast<double>(i));
    const auto up = TechnicalIndicators::calculateRSI(rising, 2, 3);
    assert(up.valid());
    assert(!up.rsi[0] && !up.rsi[1]);
    for (size_t i = 2; i < up.rsi.size(); ++i) {
        assert(up.rsi[i] && near(*up.rsi[i], 100.0));
    }

    // Mixed series stays in range and the signal line starts after the RSI
    std::vector<double> mixed;
    for (int i = 0; i < 80; ++i) {
        mixed.push_back(100.0 + 5.0 * std::sin(i * 0.4) + (i % 3) * 0.7);
    }
    const auto rsi = TechnicalIndicators::calculateRSI(mixed, 14, 3);
    assert(rsi.valid());
    assert(rsi.signal.size() == mixed.size());
    assert(rsi.divergence.size() == mixed.size());
    for (size_t i = 0; i < rsi.rsi.size(); ++i) {
        if (i < 14) {
            assert(!rsi.rsi[i]);
            continue;
        }
        assert(rsi.rsi[i]);
        assert(*rsi.rsi[i] >= 0.0 && *rsi.rsi[i] <= 100.0);
    }
    assert(!rsi.signal[14] && !rsi.signal[15]);
    assert(rsi.signal[16]);
    assert(rsi.histogram[20] && near(*rsi.histogram[20], *rsi.rsi[20] - *rsi.signal[20]));

    // Steady rise: RSI pinned at 100, no divergence
    for (int flag : up.divergence) {
        assert(flag == 0);
    }

    // Lower low over five bars while RSI recovers from 0
    const std::vector<double> falling = {100, 90, 80, 70, 60, 50, 49, 49.5, 48, 48.5, 47};
    const auto bullish = TechnicalIndicators::calculateRSI(falling, 2, 3);
    assert(bullish.valid());
    assert(near(*bullish.rsi[5], 0.0));
    assert(*bullish.rsi[10] > 0.0);
    assert(bullish.divergence[6] == 0);
    assert(bullish.divergence[10] == 1);

    // Higher high over five bars while RSI slips from 100
    const std::vector<double> climbing = {10, 20, 30, 40, 50, 60, 61, 60.5, 62, 61.5, 63};
    const auto bearish = TechnicalIndicators::calculateRSI(climbing, 2, 3);
    assert(bearish.valid());
    assert(near(*bearish.rsi[5], 100.0));
    assert(*bearish.rsi[10] < 100.0);
    assert(bearish.divergence[6] == 0);
    assert(bearish.divergence[10] == -1);

    assert(!TechnicalIndicators::calculateRSI({1, 2, 3}, 14).valid());

    const auto point = TechnicalIndicators::calculateRSIPoint(11.0, 10.0, 1.0, 0.0, 14);
    assert(point && near(point->rsi, 100.0));
    std::cout << "[TEST] RSI PASSED" << std::endl;
}

void testMACD() {
    std::vector<double> prices;
    for (int i = 0; i < 60; ++i) prices.push_back(50.0 + i * 0.5);

    const auto macd = TechnicalIndicators::calculateMACD(prices, 12, 26, 9);
    assert(macd.valid());
    assert(!macd.macd[24]);
    assert(macd.macd[25]);
    assert(!macd.signal[32]);
    assert(macd.signal[33]);
    // Steady uptrend keeps the fast EMA above the slow one
    assert(*macd.macd.back() > 0.0);

    assert(!TechnicalIndicators::calculateMACD(prices, 26, 12, 9).valid());
    assert(!TechnicalIndicators::calculateMACD(prices, 12, 26, 0).valid());
    assert(!TechnicalIndicators::validateMACDPeriods(30, 12, 26, 9));
    assert(TechnicalIndicators::validateMACDPeriods(34, 12, 26, 9));
    assert(!TechnicalIndicators::calculateMACDPoint(1.0, 1.0, 1.0, 0.0, 12, 12, 9));
    std::cout << "[TEST] MACD PASSED" << std::endl;
}

void testBollinger() {
    const std::vector<double> flat(25, 10.0);
    const auto bands = TechnicalIndicators::calculateBollingerBands(flat, 20, 2.0);
    assert(bands.valid());
    assert(!bands.middle[18]);
    assert(bands.middle[19] && near(*bands.middle[19], 10.0));
    assert(near(*bands.upper[24], 10.0) && near(*bands.lower[24], 10.0));
    assert(bands.width[24] && near(*bands.width[24], 0.0));

    const std::vector<double> zeros(20, 0.0);
    const auto zero_bands = TechnicalIndicators::calculateBollingerBands(zeros, 20, 2.0);
    assert(zero_bands.valid() && !zero_bands.width[19]);

    assert(!TechnicalIndicators::calculateBollingerBands(flat, 30).valid());
    assert(!TechnicalIndicators::calculateBollingerBands(flat, 0).valid());

    const auto point = TechnicalIndicators::calculateBollingerPoint(flat, 10.0, 20, 2.0);
    assert(point && near(point->percent_b, 0.5));
    std::cout << "[TEST] Bollinger PASSED" << std::endl;
}

void testCrossover() {
    const IndicatorSeries fast = {std::nullopt, 9.0, 11.0};
    const IndicatorSeries slow = {std::nullopt, 10.0, 10.0};
    const auto bull = TechnicalIndicators::detectCrossover(fast, slow);
    assert(bull.crossed && bull.direction == 1);
    assert(near(bull.strength, 0.1));

    const auto bear = TechnicalIndicators::detectCrossover(slow, fast);
    assert(bear.crossed && bear.direction == -1);

    const IndicatorSeries undefined = {std::nullopt, std::nullopt, 11.0};
    assert(!TechnicalIndicators::detectCrossover(undefined, slow).crossed);
    assert(!TechnicalIndicators::detectCrossover(slow, slow).crossed);
    std::cout << "[TEST] Crossover PASSED" << std::endl;
}

void testHelpers() {
    assert(near(TechnicalIndicators::calculateSMA({1, 2, 3, 4}, 2), 3.5));
    assert(near(TechnicalIndicators::calculateSMA({1}, 2), 0.0));
    assert(near(TechnicalIndicators::calculateStandardDeviation({2, 4, 4, 4, 5, 5, 7, 9}, 5.0), 2.0));
    assert(!TechnicalIndicators::latest(IndicatorSeries()));
    assert(!TechnicalIndicators::valueAt(IndicatorSeries{1.0}, 3));
}
}

int main() {
    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;

    testEMA();
    testRSI();
    testMACD();
    testBollinger();
    testCrossover();
    testHelpers();

    std::cout << "[TEST] TechnicalIndicators Test PASSED!" << std::endl;
    return 0;
}

#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "signal_ngin/indicators/divergence.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class DivergenceTest : public TestBase {
protected:
    static std::vector<Candle> candles_from_lows(const std::vector<double>& lows, double width) {
        std::vector<Candle> candles;
        for (size_t i = 0; i < lows.size(); ++i) {
            double low = lows[i];
            candles.emplace_back(hours_from_epoch(static_cast<int64_t>(i)), low, low + width, low,
                                 low);
        }
        return candles;
    }

    static RsiSeries flat_rsi(size_t size, double value = 50.0) {
        return RsiSeries(size, value);
    }

    DivergenceDetector detector;
};

TEST_F(DivergenceTest, MonotonicPricesHaveNoExtrema) {
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) {
        closes.push_back(100.0 + i);
    }
    auto candles = candles_from_closes(closes);

    auto result = detector.detect(flat_rsi(candles.size()), candles, 10);
    EXPECT_FALSE(result.bullish);
    EXPECT_FALSE(result.bearish);
    EXPECT_FALSE(result.strength.has_value());
    EXPECT_TRUE(result.divergence_points.empty());
}

TEST_F(DivergenceTest, LowerLowWithHigherRsiIsBullish) {
    // Minima at 2 and 6; the only maximum is at 4
    auto candles = candles_from_lows({10, 9, 8, 9, 10, 9, 7, 8, 9, 10}, 1.0);
    auto rsi = flat_rsi(candles.size());
    rsi[2] = 30.0;
    rsi[6] = 35.0;

    auto result = detector.detect(rsi, candles, 10);
    EXPECT_TRUE(result.bullish);
    EXPECT_FALSE(result.bearish);
    ASSERT_TRUE(result.strength.has_value());
    EXPECT_DOUBLE_EQ(*result.strength, DivergenceDetector::kDetectedStrength);
    EXPECT_EQ(result.divergence_points, (std::vector<size_t>{2, 6}));
}

TEST_F(DivergenceTest, HigherHighWithLowerRsiIsBearish) {
    // Maxima at 2 and 6 once the highs are one above the lows
    auto candles = candles_from_lows({9, 10, 11, 10, 9, 10, 12, 11, 10, 9}, 1.0);
    auto rsi = flat_rsi(candles.size());
    rsi[2] = 70.0;
    rsi[6] = 65.0;

    auto result = detector.detect(rsi, candles, 10);
    EXPECT_FALSE(result.bullish);
    EXPECT_TRUE(result.bearish);
    ASSERT_TRUE(result.strength.has_value());
    EXPECT_DOUBLE_EQ(*result.strength, 0.7);

    nlohmann::json j = result.to_json();
    EXPECT_EQ(j["bearish"], true);
    EXPECT_EQ(j["divergence_points"], nlohmann::json::array({2, 6}));
}

TEST_F(DivergenceTest, ConfirmingRsiIsNotDivergence) {
    auto candles = candles_from_lows({10, 9, 8, 9, 10, 9, 7, 8, 9, 10}, 1.0);
    auto rsi = flat_rsi(candles.size());
    rsi[2] = 35.0;
    rsi[6] = 30.0;

    EXPECT_FALSE(detector.detect(rsi, candles, 10).any());
}

TEST_F(DivergenceTest, WindowUsesOnlyTheTail) {
    // The bullish pattern sits before the window
    auto candles = candles_from_lows({10, 9, 8, 9, 10, 9, 7, 8, 9, 10, 11, 12, 13, 14, 15}, 1.0);
    auto rsi = flat_rsi(candles.size());
    rsi[2] = 30.0;
    rsi[6] = 35.0;

    EXPECT_TRUE(detector.detect(rsi, candles, 15).bullish);
    EXPECT_FALSE(detector.detect(rsi, candles, 5).any());
}

TEST_F(DivergenceTest, ShortOrUndefinedInputIsNoDivergence) {
    auto candles = candles_from_lows({10, 9, 8, 9, 10, 9, 7, 8, 9, 10}, 1.0);
    auto rsi = flat_rsi(candles.size());
    rsi[2] = 30.0;
    rsi[6] = 35.0;

    EXPECT_FALSE(detector.detect(rsi, candles, 20).any());
    EXPECT_FALSE(detector.detect(rsi, candles, 2).any());

    rsi[0] = std::nullopt;
    auto undefined = detector.detect(rsi, candles, 10);
    EXPECT_FALSE(undefined.any());
    EXPECT_FALSE(undefined.strength.has_value());
}

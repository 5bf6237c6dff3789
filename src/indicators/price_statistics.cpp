// src/indicators/price_statistics.cpp
#include "signal_ngin/indicators/price_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include "signal_ngin/indicators/moving_average.hpp"

namespace signal_ngin {

std::string trend_to_string(Trend trend) {
    switch (trend) {
        case Trend::STRONGLY_BULLISH:
            return "strongly_bullish";
        case Trend::BULLISH:
            return "bullish";
        case Trend::NEUTRAL:
            return "neutral";
        case Trend::BEARISH:
            return "bearish";
        case Trend::STRONGLY_BEARISH:
            return "strongly_bearish";
    }
    return "neutral";
}

nlohmann::json PriceStatistics::to_json() const {
    nlohmann::json j;
    j["highest_price"] = highest_price;
    j["lowest_price"] = lowest_price;
    j["avg_close"] = avg_close;
    j["price_change_pct"] = price_change_pct;
    j["volatility"] = volatility;
    j["trend"] = trend_to_string(trend);
    return j;
}

double annualized_volatility(const std::vector<double>& prices) {
    if (prices.size() < 2) {
        return 0.0;
    }

    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        returns.push_back(std::log(prices[i] / prices[i - 1]));
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= returns.size();

    return std::sqrt(variance) * std::sqrt(252.0);
}

Trend classify_trend(const std::vector<double>& prices) {
    const size_t third = prices.size() / 3;
    if (third == 0) {
        return Trend::NEUTRAL;
    }

    double avg_first = std::accumulate(prices.begin(), prices.begin() + third, 0.0) / third;
    double avg_last = std::accumulate(prices.end() - third, prices.end(), 0.0) / third;
    if (avg_first == 0.0) {
        return Trend::NEUTRAL;
    }

    double change = (avg_last - avg_first) / avg_first;
    if (change > 0.02)
        return Trend::STRONGLY_BULLISH;
    if (change > 0.005)
        return Trend::BULLISH;
    if (change < -0.02)
        return Trend::STRONGLY_BEARISH;
    if (change < -0.005)
        return Trend::BEARISH;
    return Trend::NEUTRAL;
}

Result<PriceStatistics> compute_price_statistics(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        return make_error<PriceStatistics>(ErrorCode::INSUFFICIENT_DATA,
                                           "No candles to summarize", "PriceStatistics");
    }

    const std::vector<double> closes = closes_of(candles);
    PriceStatistics stats;
    stats.highest_price = candles.front().high;
    stats.lowest_price = candles.front().low;
    for (const auto& candle : candles) {
        stats.highest_price = std::max(stats.highest_price, candle.high);
        stats.lowest_price = std::min(stats.lowest_price, candle.low);
    }
    stats.avg_close = std::accumulate(closes.begin(), closes.end(), 0.0) / closes.size();

    if (candles.size() > 1 && candles.front().open > 0.0) {
        stats.price_change_pct =
            (candles.back().close - candles.front().open) / candles.front().open * 100.0;
    }
    stats.volatility = annualized_volatility(closes);
    stats.trend = classify_trend(closes);
    return stats;
}

}  // namespace signal_ngin

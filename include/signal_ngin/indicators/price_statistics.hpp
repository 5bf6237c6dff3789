// include/signal_ngin/indicators/price_statistics.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Trend label from comparing the first and last third of a series
 */
enum class Trend { STRONGLY_BULLISH, BULLISH, NEUTRAL, BEARISH, STRONGLY_BEARISH };

std::string trend_to_string(Trend trend);

/**
 * @brief Summary statistics over a candle window
 */
struct PriceStatistics {
    double highest_price{0.0};
    double lowest_price{0.0};
    double avg_close{0.0};
    double price_change_pct{0.0};  // last close against first open
    double volatility{0.0};        // annualized, 252 periods
    Trend trend{Trend::NEUTRAL};

    nlohmann::json to_json() const;
};

/**
 * @brief Annualized standard deviation of log returns
 * @return 0 for fewer than two prices
 */
double annualized_volatility(const std::vector<double>& prices);

/**
 * @brief Classify the relative change between the mean of the first and last third
 *
 * Above 2% is strongly bullish, above 0.5% bullish, mirrored for bearish.
 * Fewer than three prices is neutral.
 */
Trend classify_trend(const std::vector<double>& prices);

/**
 * @brief Statistics of a candle window
 * @return INSUFFICIENT_DATA for an empty window
 */
Result<PriceStatistics> compute_price_statistics(const std::vector<Candle>& candles);

}  // namespace signal_ngin

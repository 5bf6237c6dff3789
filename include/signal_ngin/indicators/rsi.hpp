// include/signal_ngin/indicators/rsi.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief RSI values aligned 1:1 with the input candles, nullopt where undefined
 */
using RsiSeries = std::vector<std::optional<double>>;

/**
 * @brief Direction of recent RSI movement
 */
enum class Momentum { BUILDING, WEAKENING, STRONG, WEAK, NEUTRAL };

std::string momentum_to_string(Momentum momentum);

/**
 * @brief Relative Strength Index with Wilder smoothing
 *
 * The first averages are simple means of the first period gains and losses;
 * later ones follow avg' = (avg * (period - 1) + x) / period. The first
 * defined value sits at index period. A zero average loss yields 100.
 */
class RsiCalculator {
public:
    explicit RsiCalculator(int period = 14) : period_(period) {}

    int period() const {
        return period_;
    }

    /**
     * @brief RSI of the close series
     *
     * Fewer than period + 1 candles (or a non-positive period) gives an
     * all-undefined series of the same length.
     */
    RsiSeries series(const std::vector<Candle>& candles) const;

    /**
     * @brief RSI of the close series, failing when it cannot be defined
     * @return INVALID_ARGUMENT for period < 1, INSUFFICIENT_DATA for fewer
     *         than period + 1 candles
     */
    Result<RsiSeries> calculate(const std::vector<Candle>& candles) const;

    /**
     * @brief Last element of a series (nullopt when empty or undefined)
     */
    static std::optional<double> latest(const RsiSeries& rsi);

private:
    int period_;
};

/**
 * @brief Classify RSI momentum over the last lookback entries
 *
 * Change between the first and last defined value above 10 is building,
 * below -10 weakening; otherwise the current value above 60 is strong and
 * below 40 weak. Fewer than two defined values is neutral.
 */
Momentum classify_momentum(const RsiSeries& rsi, size_t lookback = 5);

}  // namespace signal_ngin

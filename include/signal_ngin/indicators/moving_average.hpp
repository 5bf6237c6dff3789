// include/signal_ngin/indicators/moving_average.hpp
#pragma once

#include <optional>
#include <vector>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Exponential moving average seeded with a simple average
 *
 * The first value sits at index period - 1 and equals the mean of the first
 * period inputs; afterwards ema' = (x - ema) * k + ema with k = 2 / (period + 1).
 *
 * @param values Input series
 * @param period Smoothing period
 * @return Series aligned with the input, nullopt before the seed
 */
std::vector<std::optional<double>> calculate_ema(const std::vector<double>& values, int period);

/**
 * @brief Close prices of a candle sequence
 */
std::vector<double> closes_of(const std::vector<Candle>& candles);

}  // namespace signal_ngin

// src/indicators/moving_average.cpp
#include "signal_ngin/indicators/moving_average.hpp"

namespace signal_ngin {

std::vector<std::optional<double>> calculate_ema(const std::vector<double>& values, int period) {
    std::vector<std::optional<double>> ema(values.size());
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return ema;
    }

    const double multiplier = 2.0 / (period + 1);
    double sum = 0.0;
    for (int i = 0; i < period; ++i) {
        sum += values[i];
    }

    double current = sum / period;
    ema[period - 1] = current;
    for (size_t i = static_cast<size_t>(period); i < values.size(); ++i) {
        current = (values[i] - current) * multiplier + current;
        ema[i] = current;
    }
    return ema;
}

std::vector<double> closes_of(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

}  // namespace signal_ngin

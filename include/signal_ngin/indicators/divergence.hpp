// include/signal_ngin/indicators/divergence.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/rsi.hpp"

namespace signal_ngin {

/**
 * @brief Outcome of a price/RSI divergence scan
 */
struct DivergenceResult {
    bool bullish{false};
    bool bearish{false};
    std::optional<double> strength;
    // Window indices of the two extrema that formed the divergence
    std::vector<size_t> divergence_points;

    bool any() const {
        return bullish || bearish;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Detects disagreement between price and RSI at successive extrema
 */
class DivergenceDetector {
public:
    static constexpr double kDetectedStrength = 0.7;

    /**
     * @brief Scan the last lookback candles for divergence
     *
     * A local minimum is a candle whose low is strictly below both neighbours,
     * a local maximum one whose high is strictly above both. Bullish: the
     * latest minimum is lower than the previous one while its RSI is higher.
     * Bearish: the latest maximum is higher while its RSI is lower.
     *
     * @param rsi RSI series aligned with candles
     * @param candles Candle sequence
     * @param lookback Window size, at least 3
     * @return Both flags false when the window is short or has undefined RSI
     */
    DivergenceResult detect(const RsiSeries& rsi, const std::vector<Candle>& candles,
                            size_t lookback = 10) const;
};

}  // namespace signal_ngin

// src/indicators/divergence.cpp
#include "signal_ngin/indicators/divergence.hpp"

namespace signal_ngin {

nlohmann::json DivergenceResult::to_json() const {
    nlohmann::json j;
    j["bullish"] = bullish;
    j["bearish"] = bearish;
    j["strength"] = strength ? nlohmann::json(*strength) : nlohmann::json(nullptr);
    j["divergence_points"] = divergence_points;
    return j;
}

DivergenceResult DivergenceDetector::detect(const RsiSeries& rsi,
                                            const std::vector<Candle>& candles,
                                            size_t lookback) const {
    DivergenceResult result;
    if (lookback < 3 || candles.size() < lookback || rsi.size() < lookback) {
        return result;
    }

    const size_t candle_offset = candles.size() - lookback;
    const size_t rsi_offset = rsi.size() - lookback;
    for (size_t i = 0; i < lookback; ++i) {
        if (!rsi[rsi_offset + i]) {
            return result;
        }
    }

    auto candle_at = [&](size_t i) -> const Candle& { return candles[candle_offset + i]; };
    auto rsi_at = [&](size_t i) { return *rsi[rsi_offset + i]; };

    std::vector<size_t> lows;
    std::vector<size_t> highs;
    for (size_t i = 1; i + 1 < lookback; ++i) {
        if (candle_at(i).low < candle_at(i - 1).low && candle_at(i).low < candle_at(i + 1).low) {
            lows.push_back(i);
        }
        if (candle_at(i).high > candle_at(i - 1).high &&
            candle_at(i).high > candle_at(i + 1).high) {
            highs.push_back(i);
        }
    }

    if (lows.size() >= 2) {
        size_t prev = lows[lows.size() - 2];
        size_t last = lows.back();
        if (candle_at(last).low < candle_at(prev).low && rsi_at(last) > rsi_at(prev)) {
            result.bullish = true;
            result.divergence_points = {prev, last};
        }
    }

    if (highs.size() >= 2) {
        size_t prev = highs[highs.size() - 2];
        size_t last = highs.back();
        if (candle_at(last).high > candle_at(prev).high && rsi_at(last) < rsi_at(prev)) {
            result.bearish = true;
            // Bullish points win when both fire
            if (result.divergence_points.empty()) {
                result.divergence_points = {prev, last};
            }
        }
    }

    if (result.any()) {
        result.strength = kDetectedStrength;
    }
    return result;
}

}  // namespace signal_ngin

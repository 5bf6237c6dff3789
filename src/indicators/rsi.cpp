// src/indicators/rsi.cpp
#include "signal_ngin/indicators/rsi.hpp"

namespace signal_ngin {

namespace {

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

}  // namespace

std::string momentum_to_string(Momentum momentum) {
    switch (momentum) {
        case Momentum::BUILDING:
            return "building";
        case Momentum::WEAKENING:
            return "weakening";
        case Momentum::STRONG:
            return "strong";
        case Momentum::WEAK:
            return "weak";
        case Momentum::NEUTRAL:
            return "neutral";
    }
    return "neutral";
}

RsiSeries RsiCalculator::series(const std::vector<Candle>& candles) const {
    RsiSeries rsi(candles.size());
    if (period_ < 1 || candles.size() < static_cast<size_t>(period_) + 1) {
        return rsi;
    }

    const size_t period = static_cast<size_t>(period_);
    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (size_t i = 1; i <= period; ++i) {
        double change = candles[i].close - candles[i - 1].close;
        if (change > 0) {
            avg_gain += change;
        } else {
            avg_loss -= change;
        }
    }
    avg_gain /= period_;
    avg_loss /= period_;
    rsi[period] = rsi_from_averages(avg_gain, avg_loss);

    for (size_t i = period + 1; i < candles.size(); ++i) {
        double change = candles[i].close - candles[i - 1].close;
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;

        avg_gain = (avg_gain * (period_ - 1) + gain) / period_;
        avg_loss = (avg_loss * (period_ - 1) + loss) / period_;
        rsi[i] = rsi_from_averages(avg_gain, avg_loss);
    }
    return rsi;
}

Result<RsiSeries> RsiCalculator::calculate(const std::vector<Candle>& candles) const {
    if (period_ < 1) {
        return make_error<RsiSeries>(ErrorCode::INVALID_ARGUMENT,
                                     "RSI period must be at least 1, got " +
                                         std::to_string(period_),
                                     "RsiCalculator");
    }
    if (candles.size() < static_cast<size_t>(period_) + 1) {
        return make_error<RsiSeries>(ErrorCode::INSUFFICIENT_DATA,
                                     "RSI(" + std::to_string(period_) + ") needs " +
                                         std::to_string(period_ + 1) + " candles, got " +
                                         std::to_string(candles.size()),
                                     "RsiCalculator");
    }
    return series(candles);
}

std::optional<double> RsiCalculator::latest(const RsiSeries& rsi) {
    if (rsi.empty()) {
        return std::nullopt;
    }
    return rsi.back();
}

Momentum classify_momentum(const RsiSeries& rsi, size_t lookback) {
    std::vector<double> recent;
    size_t start = rsi.size() > lookback ? rsi.size() - lookback : 0;
    for (size_t i = start; i < rsi.size(); ++i) {
        if (rsi[i]) {
            recent.push_back(*rsi[i]);
        }
    }

    if (recent.size() < 2) {
        return Momentum::NEUTRAL;
    }

    double current = recent.back();
    double change = current - recent.front();
    if (change > 10)
        return Momentum::BUILDING;
    if (change < -10)
        return Momentum::WEAKENING;
    if (current > 60)
        return Momentum::STRONG;
    if (current < 40)
        return Momentum::WEAK;
    return Momentum::NEUTRAL;
}

}  // namespace signal_ngin

// src/strategy/signal_detector.cpp
#include "signal_ngin/strategy/signal_detector.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include "signal_ngin/indicators/moving_average.hpp"

namespace signal_ngin {

namespace {

std::string fixed2(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

nlohmann::json optional_to_json(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::string exit_trigger_to_string(ExitTrigger trigger) {
    switch (trigger) {
        case ExitTrigger::NONE:
            return "none";
        case ExitTrigger::STOP_LOSS:
            return "stop_loss";
        case ExitTrigger::TAKE_PROFIT:
            return "take_profit";
        case ExitTrigger::RSI_OVERBOUGHT:
            return "rsi_overbought";
    }
    return "none";
}

nlohmann::json ExitSignal::to_json() const {
    nlohmann::json j;
    j["should_exit"] = should_exit;
    j["trigger"] = exit_trigger_to_string(trigger);
    j["trigger_level"] = optional_to_json(trigger_level);
    j["stop_loss"] = stop_loss;
    j["take_profit"] = take_profit;
    j["reason"] = reason;
    return j;
}

nlohmann::json SignalResult::to_json() const {
    nlohmann::json j;
    j["action"] = action_to_string(action);
    j["confidence"] = confidence;
    j["entry_price"] = optional_to_json(entry_price);
    j["stop_loss"] = optional_to_json(stop_loss);
    j["take_profit"] = optional_to_json(take_profit);
    j["risk_reward_ratio"] = optional_to_json(risk_reward_ratio);
    j["reason"] = reason;
    return j;
}

SignalDetector::SignalDetector(SignalPolicyConfig policy) : policy_(std::move(policy)) {
    auto valid = policy_.validate();
    if (valid.is_error()) {
        throw *valid.error();
    }
}

BuySignal SignalDetector::detect_buy_signal(const RsiSeries& rsi,
                                            const std::vector<Candle>& candles,
                                            InstrumentCategory category,
                                            const std::optional<DivergenceResult>& divergence) const {
    BuySignal result;
    if (rsi.size() < 2 || candles.size() < 2) {
        result.reason = "Insufficient RSI data";
        return result;
    }

    const auto& current_rsi = rsi[rsi.size() - 1];
    const auto& previous_rsi = rsi[rsi.size() - 2];
    if (!current_rsi || !previous_rsi) {
        result.reason = "RSI values not yet available";
        return result;
    }

    const CategoryThresholds& t = policy_.for_category(category);
    const double current_close = candles[candles.size() - 1].close;
    const double previous_close = candles[candles.size() - 2].close;
    const bool crossover = *previous_rsi < t.oversold && *current_rsi > t.oversold;

    bool matched = false;
    std::string reason = "RSI oversold reversal";

    if (crossover) {
        switch (category) {
            case InstrumentCategory::WRAPPED_BTC:
                matched = current_close > previous_close;
                break;
            case InstrumentCategory::TOKENIZED_STOCK: {
                auto ema = calculate_ema(closes_of(candles), policy_.trend_ema_period);
                if (ema.back() && current_close > *ema.back()) {
                    matched = true;
                    reason += " above EMA" + std::to_string(policy_.trend_ema_period);
                }
                break;
            }
            case InstrumentCategory::GOLD_TOKEN: {
                size_t run = static_cast<size_t>(policy_.consecutive_closes);
                if (candles.size() >= run) {
                    matched = true;
                    for (size_t i = candles.size() - run + 1; i < candles.size(); ++i) {
                        if (!(candles[i].close > candles[i - 1].close)) {
                            matched = false;
                            break;
                        }
                    }
                }
                if (matched) {
                    reason += " with " + std::to_string(run) + " consecutive higher closes";
                }
                break;
            }
        }
    }

    if (!matched) {
        std::string zone;
        if (*current_rsi < t.oversold) {
            zone = "below oversold";
        } else if (*current_rsi > t.overbought) {
            zone = "above overbought";
        } else {
            zone = "within neutral zone";
        }
        result.reason = "RSI " + zone + " (" + fixed2(*current_rsi) + ")";
        return result;
    }

    double confidence = policy_.base_confidence;
    if (current_close > previous_close * (1.0 + policy_.strong_move_pct)) {
        confidence += policy_.strong_move_bonus;
        reason += ", strong upward price movement";
    }
    if (divergence && divergence->bullish) {
        confidence += policy_.divergence_bonus;
        reason += " with bullish divergence confirmation";
    }

    result.signal = true;
    result.confidence = std::min(confidence, 1.0);
    result.reason = reason;
    return result;
}

Result<ExitSignal> SignalDetector::detect_exit_signal(const RsiSeries& rsi,
                                                      const std::vector<Candle>& candles,
                                                      double entry_price,
                                                      InstrumentCategory category) const {
    if (!(entry_price > 0.0)) {
        return make_error<ExitSignal>(ErrorCode::INVALID_ARGUMENT,
                                      "Entry price must be positive, got " +
                                          std::to_string(entry_price),
                                      "SignalDetector");
    }
    if (candles.empty()) {
        return make_error<ExitSignal>(ErrorCode::INSUFFICIENT_DATA,
                                      "No candles to evaluate exit", "SignalDetector");
    }

    const CategoryThresholds& t = policy_.for_category(category);
    const double current_price = candles.back().close;
    const auto current_rsi = RsiCalculator::latest(rsi);

    ExitSignal decision;
    decision.stop_loss = entry_price * (1.0 - t.stop_loss_pct);
    decision.take_profit = entry_price * (1.0 + t.take_profit_pct);

    if (current_price <= decision.stop_loss) {
        decision.should_exit = true;
        decision.trigger = ExitTrigger::STOP_LOSS;
        decision.trigger_level = decision.stop_loss;
        decision.reason = "Stop loss triggered at " + fixed2(current_price) + " (entry: " +
                          fixed2(entry_price) + ")";
    } else if (current_price >= decision.take_profit) {
        decision.should_exit = true;
        decision.trigger = ExitTrigger::TAKE_PROFIT;
        decision.trigger_level = decision.take_profit;
        decision.reason = "Take profit target reached at " + fixed2(current_price) +
                          " (entry: " + fixed2(entry_price) + ")";
    } else if (current_rsi && *current_rsi > t.overbought) {
        decision.should_exit = true;
        decision.trigger = ExitTrigger::RSI_OVERBOUGHT;
        decision.trigger_level = t.overbought;
        decision.reason =
            "RSI overbought (" + fixed2(*current_rsi) + " > " + fixed2(t.overbought) + ")";
    } else {
        decision.reason = "No exit signal";
    }
    return decision;
}

SignalResult SignalDetector::evaluate(const RsiSeries& rsi, const std::vector<Candle>& candles,
                                      InstrumentCategory category,
                                      const DivergenceResult& divergence) const {
    SignalResult result;
    BuySignal buy = detect_buy_signal(rsi, candles, category, divergence);
    const CategoryThresholds& t = policy_.for_category(category);

    if (buy.signal) {
        const double price = candles.back().close;
        result.action = SignalAction::BUY;
        result.confidence = buy.confidence;
        result.entry_price = price;
        result.stop_loss = price * (1.0 - t.stop_loss_pct);
        result.take_profit = price * (1.0 + t.take_profit_pct);
        result.risk_reward_ratio = t.take_profit_pct / t.stop_loss_pct;
        result.reason = buy.reason;
        return result;
    }

    const auto current_rsi = RsiCalculator::latest(rsi);
    if (current_rsi && *current_rsi > t.overbought) {
        result.action = SignalAction::SELL;
        result.confidence = policy_.overbought_sell_confidence;
        result.reason = "RSI overbought at " + fixed2(*current_rsi);
        return result;
    }

    result.action = SignalAction::HOLD;
    result.confidence = 0.0;
    result.reason = buy.reason;
    return result;
}

}  // namespace signal_ngin

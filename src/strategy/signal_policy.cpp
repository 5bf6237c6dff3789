// src/strategy/signal_policy.cpp
#include "signal_ngin/strategy/signal_policy.hpp"

namespace signal_ngin {

nlohmann::json CategoryThresholds::to_json() const {
    nlohmann::json j;
    j["rsi_period"] = rsi_period;
    j["oversold"] = oversold;
    j["overbought"] = overbought;
    j["stop_loss_pct"] = stop_loss_pct;
    j["take_profit_pct"] = take_profit_pct;
    j["default_interval"] = interval_to_string(default_interval);
    return j;
}

void CategoryThresholds::from_json(const nlohmann::json& j) {
    if (j.contains("rsi_period"))
        rsi_period = j.at("rsi_period").get<int>();
    if (j.contains("oversold"))
        oversold = j.at("oversold").get<double>();
    if (j.contains("overbought"))
        overbought = j.at("overbought").get<double>();
    if (j.contains("stop_loss_pct"))
        stop_loss_pct = j.at("stop_loss_pct").get<double>();
    if (j.contains("take_profit_pct"))
        take_profit_pct = j.at("take_profit_pct").get<double>();
    if (j.contains("default_interval")) {
        auto interval = parse_interval(j.at("default_interval").get<std::string>());
        if (interval.is_error()) {
            throw *interval.error();
        }
        default_interval = interval.value();
    }
}

std::map<InstrumentCategory, CategoryThresholds> SignalPolicyConfig::default_thresholds() {
    std::map<InstrumentCategory, CategoryThresholds> table;
    table[InstrumentCategory::WRAPPED_BTC] = {14, 30.0, 70.0, 0.03, 0.05, Interval::HOUR_1};
    table[InstrumentCategory::TOKENIZED_STOCK] = {14, 35.0, 65.0, 0.025, 0.04, Interval::MINUTE_5};
    table[InstrumentCategory::GOLD_TOKEN] = {14, 25.0, 75.0, 0.015, 0.03, Interval::HOUR_1};
    return table;
}

const CategoryThresholds& SignalPolicyConfig::for_category(InstrumentCategory category) const {
    auto it = thresholds.find(category);
    if (it != thresholds.end()) {
        return it->second;
    }
    static const auto defaults = default_thresholds();
    return defaults.at(category);
}

Result<void> SignalPolicyConfig::validate() const {
    for (const auto& [category, t] : thresholds) {
        const std::string name = category_to_string(category);
        if (t.rsi_period < 1) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    name + ": rsi_period must be at least 1", "SignalPolicy");
        }
        if (!(t.oversold > 0.0 && t.oversold < t.overbought && t.overbought < 100.0)) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    name + ": thresholds must satisfy 0 < oversold < "
                                           "overbought < 100",
                                    "SignalPolicy");
        }
        if (t.stop_loss_pct <= 0.0 || t.stop_loss_pct >= 1.0 || t.take_profit_pct <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    name + ": stop_loss_pct must be in (0,1) and "
                                           "take_profit_pct positive",
                                    "SignalPolicy");
        }
    }

    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };
    if (!in_unit(base_confidence) || !in_unit(strong_move_bonus) || !in_unit(divergence_bonus) ||
        !in_unit(overbought_sell_confidence)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Confidence values must lie in [0, 1]", "SignalPolicy");
    }
    if (trend_ema_period < 1 || consecutive_closes < 2) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "trend_ema_period must be >= 1 and consecutive_closes >= 2",
                                "SignalPolicy");
    }
    return Result<void>();
}

nlohmann::json SignalPolicyConfig::to_json() const {
    nlohmann::json j;
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& [category, t] : thresholds) {
        categories[category_to_string(category)] = t.to_json();
    }
    j["categories"] = categories;
    j["base_confidence"] = base_confidence;
    j["strong_move_pct"] = strong_move_pct;
    j["strong_move_bonus"] = strong_move_bonus;
    j["divergence_bonus"] = divergence_bonus;
    j["overbought_sell_confidence"] = overbought_sell_confidence;
    j["trend_ema_period"] = trend_ema_period;
    j["consecutive_closes"] = consecutive_closes;
    return j;
}

void SignalPolicyConfig::from_json(const nlohmann::json& j) {
    if (j.contains("categories")) {
        for (const auto& [name, value] : j.at("categories").items()) {
            auto category = parse_category(name);
            if (category.is_error()) {
                throw *category.error();
            }
            thresholds[category.value()].from_json(value);
        }
    }
    if (j.contains("base_confidence"))
        base_confidence = j.at("base_confidence").get<double>();
    if (j.contains("strong_move_pct"))
        strong_move_pct = j.at("strong_move_pct").get<double>();
    if (j.contains("strong_move_bonus"))
        strong_move_bonus = j.at("strong_move_bonus").get<double>();
    if (j.contains("divergence_bonus"))
        divergence_bonus = j.at("divergence_bonus").get<double>();
    if (j.contains("overbought_sell_confidence"))
        overbought_sell_confidence = j.at("overbought_sell_confidence").get<double>();
    if (j.contains("trend_ema_period"))
        trend_ema_period = j.at("trend_ema_period").get<int>();
    if (j.contains("consecutive_closes"))
        consecutive_closes = j.at("consecutive_closes").get<int>();
}

}  // namespace signal_ngin

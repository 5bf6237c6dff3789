// include/signal_ngin/strategy/signal_policy.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief RSI parameters and risk levels of one instrument category
 */
struct CategoryThresholds {
    int rsi_period{14};
    double oversold{30.0};
    double overbought{70.0};
    double stop_loss_pct{0.03};    // fraction of entry price
    double take_profit_pct{0.05};  // fraction of entry price
    Interval default_interval{Interval::HOUR_1};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Threshold table and scoring knobs of the signal detector
 */
struct SignalPolicyConfig : public ConfigBase {
    std::map<InstrumentCategory, CategoryThresholds> thresholds{default_thresholds()};

    // Scoring
    double base_confidence{0.5};
    double strong_move_pct{0.005};  // close above prev close by more than this
    double strong_move_bonus{0.1};
    double divergence_bonus{0.2};
    double overbought_sell_confidence{0.6};

    // Category confirmations
    int trend_ema_period{50};   // tokenized stocks: close above this EMA
    int consecutive_closes{3};  // gold: strictly increasing closes

    /**
     * @brief Thresholds of a category (falls back to the built-in table)
     */
    const CategoryThresholds& for_category(InstrumentCategory category) const;

    /**
     * @brief Check the table for consistency
     * @return INVALID_ARGUMENT describing the first violated constraint
     */
    Result<void> validate() const;

    static std::map<InstrumentCategory, CategoryThresholds> default_thresholds();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace signal_ngin

// include/signal_ngin/strategy/signal_detector.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"
#include "signal_ngin/indicators/divergence.hpp"
#include "signal_ngin/indicators/rsi.hpp"
#include "signal_ngin/strategy/signal_policy.hpp"

namespace signal_ngin {

/**
 * @brief Result of the buy-side rule check
 */
struct BuySignal {
    bool signal{false};
    double confidence{0.0};
    std::string reason;
};

/**
 * @brief Condition that triggered an exit
 */
enum class ExitTrigger { NONE, STOP_LOSS, TAKE_PROFIT, RSI_OVERBOUGHT };

std::string exit_trigger_to_string(ExitTrigger trigger);

/**
 * @brief Result of the exit rule check for a hypothetical entry
 */
struct ExitSignal {
    bool should_exit{false};
    ExitTrigger trigger{ExitTrigger::NONE};
    std::optional<double> trigger_level;  // price or RSI level that fired
    double stop_loss{0.0};
    double take_profit{0.0};
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Advisory action with its risk levels
 */
struct SignalResult {
    SignalAction action{SignalAction::HOLD};
    double confidence{0.0};
    std::optional<double> entry_price;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<double> risk_reward_ratio;
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Applies the per-category RSI rules
 *
 * All checks are pure functions of their inputs; no position state is kept.
 */
class SignalDetector {
public:
    explicit SignalDetector(SignalPolicyConfig policy = SignalPolicyConfig());

    /**
     * @brief Check for an oversold reversal on the two latest RSI values
     *
     * Every category needs prev RSI < oversold < current RSI. Wrapped BTC
     * also needs a rising close, tokenized stocks a close above the trend
     * EMA, gold a run of strictly increasing closes.
     *
     * @param rsi RSI series aligned with candles
     * @param candles Candle sequence
     * @param category Instrument category selecting the rule set
     * @param divergence Optional divergence adding a bonus when bullish
     */
    BuySignal detect_buy_signal(const RsiSeries& rsi, const std::vector<Candle>& candles,
                                InstrumentCategory category,
                                const std::optional<DivergenceResult>& divergence =
                                    std::nullopt) const;

    /**
     * @brief Check a hypothetical position entered at entry_price
     *
     * Stop-loss is checked first, then take-profit, then overbought RSI.
     *
     * @return INVALID_ARGUMENT for entry_price <= 0, INSUFFICIENT_DATA for no candles
     */
    Result<ExitSignal> detect_exit_signal(const RsiSeries& rsi,
                                          const std::vector<Candle>& candles,
                                          double entry_price, InstrumentCategory category) const;

    /**
     * @brief Combine the buy check and overbought state into one action
     */
    SignalResult evaluate(const RsiSeries& rsi, const std::vector<Candle>& candles,
                          InstrumentCategory category, const DivergenceResult& divergence) const;

    const SignalPolicyConfig& policy() const {
        return policy_;
    }

private:
    SignalPolicyConfig policy_;
};

}  // namespace signal_ngin

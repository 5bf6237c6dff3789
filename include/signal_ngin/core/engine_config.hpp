// include/signal_ngin/core/engine_config.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "signal_ngin/analysis/rsi_analyzer.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/candle_store.hpp"
#include "signal_ngin/data/jupiter_price_feed.hpp"
#include "signal_ngin/data/market_data_poller.hpp"
#include "signal_ngin/data/quote_service.hpp"
#include "signal_ngin/instruments/instrument.hpp"
#include "signal_ngin/service/payment_gate.hpp"
#include "signal_ngin/strategy/signal_policy.hpp"

namespace signal_ngin {

/**
 * @brief Complete configuration of the signal engine
 *
 * Sections mirror the top-level keys of the JSON file:
 * logging, candles, quotes, feed, poller, policy, analysis, payments,
 * instruments, fetch_threads, analysis_threads.
 */
struct EngineConfig : public ConfigBase {
    LoggerConfig logging;
    CandleStoreConfig candles;
    QuoteServiceConfig quotes;
    JupiterFeedConfig feed;
    PollerConfig poller;
    SignalPolicyConfig policy;
    AnalysisConfig analysis;
    PaymentConfig payments;
    std::vector<InstrumentSpec> instruments;  // default universe when empty
    size_t fetch_threads{4};
    size_t analysis_threads{4};

    nlohmann::json to_json() const override;

    /**
     * @brief Overlay JSON onto the current values
     * @throws SignalError on an unknown instrument category
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Builds an EngineConfig from defaults, a JSON file and the environment
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration
     * @param config_file JSON file merged over the defaults, skipped when empty
     * @return Result containing the config or FILE_NOT_FOUND / JSON_PARSE_ERROR /
     *         INVALID_ARGUMENT
     */
    static Result<EngineConfig> load(const std::filesystem::path& config_file = {});

    /**
     * @brief Apply CACHE_TTL, MAX_CANDLES, POLL_INTERVAL_MS, JUPITER_PRICE_API_URL,
     *        X402_PAYMENT_ENABLED and X402_FACILITATOR_URL
     * @return INVALID_ARGUMENT when a numeric variable does not parse
     */
    static Result<void> apply_env_overrides(EngineConfig& config);

    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
};

}  // namespace signal_ngin

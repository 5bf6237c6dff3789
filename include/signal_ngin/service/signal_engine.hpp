// include/signal_ngin/service/signal_engine.hpp
#pragma once

#include <atomic>
#include <memory>
#include "signal_ngin/analysis/rsi_analyzer.hpp"
#include "signal_ngin/core/engine_config.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/worker_pool.hpp"
#include "signal_ngin/data/candle_store.hpp"
#include "signal_ngin/data/market_data_poller.hpp"
#include "signal_ngin/data/price_feed.hpp"
#include "signal_ngin/data/quote_service.hpp"
#include "signal_ngin/instruments/instrument_registry.hpp"
#include "signal_ngin/service/payment_gate.hpp"
#include "signal_ngin/strategy/signal_detector.hpp"

namespace signal_ngin {

/**
 * @brief Owns and wires every component of a running signal engine
 *
 * Components are built by initialize(). When no feed or gate is supplied the
 * Jupiter feed and the gate selected by payments.enabled are created over
 * libcurl.
 */
class SignalEngine {
public:
    /**
     * @brief Constructor
     * @param config Engine configuration
     * @param feed Price source override, nullptr for the Jupiter feed
     * @param gate Payment gate override, nullptr to build one from the config
     */
    explicit SignalEngine(EngineConfig config, std::shared_ptr<PriceFeed> feed = nullptr,
                          std::shared_ptr<PaymentGate> gate = nullptr);

    ~SignalEngine();

    SignalEngine(const SignalEngine&) = delete;
    SignalEngine& operator=(const SignalEngine&) = delete;

    /**
     * @brief Build the registry, stores, pools and services
     * @return INVALID_ARGUMENT on a bad instrument list or policy
     */
    Result<void> initialize();

    /**
     * @brief Start background polling if enabled
     * @return NOT_INITIALIZED before initialize()
     */
    Result<void> start();

    /**
     * @brief Stop polling and drain the worker pools
     */
    void stop();

    bool is_initialized() const {
        return initialized_.load();
    }

    const EngineConfig& config() const {
        return config_;
    }

    const InstrumentRegistry& registry() const {
        return registry_;
    }

    CandleStore& candles() {
        return *candles_;
    }

    QuoteService& quotes() {
        return *quotes_;
    }

    const SignalDetector& detector() const {
        return *detector_;
    }

    const RsiAnalyzer& analyzer() const {
        return *analyzer_;
    }

    MarketDataPoller& poller() {
        return *poller_;
    }

    PaymentGate& gate() {
        return *gate_;
    }

private:
    EngineConfig config_;
    std::shared_ptr<PriceFeed> feed_;
    std::shared_ptr<PaymentGate> gate_;
    std::atomic<bool> initialized_{false};

    InstrumentRegistry registry_;
    std::unique_ptr<CandleStore> candles_;
    std::unique_ptr<WorkerPool> fetch_pool_;
    std::unique_ptr<WorkerPool> analysis_pool_;
    std::unique_ptr<QuoteService> quotes_;
    std::unique_ptr<SignalDetector> detector_;
    std::unique_ptr<RsiAnalyzer> analyzer_;
    std::unique_ptr<MarketDataPoller> poller_;
};

}  // namespace signal_ngin

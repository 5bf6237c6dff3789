// src/service/signal_engine.cpp

#include "signal_ngin/service/signal_engine.hpp"

#include <chrono>

#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/data/http_client.hpp"
#include "signal_ngin/data/jupiter_price_feed.hpp"

namespace signal_ngin {

SignalEngine::SignalEngine(EngineConfig config, std::shared_ptr<PriceFeed> feed,
                           std::shared_ptr<PaymentGate> gate)
    : config_(std::move(config)), feed_(std::move(feed)), gate_(std::move(gate)) {}

SignalEngine::~SignalEngine() {
    stop();
}

Result<void> SignalEngine::initialize() {
    if (initialized_.load()) {
        return Result<void>();
    }

    auto specs = config_.instruments.empty() ? InstrumentRegistry::default_universe()
                                             : config_.instruments;
    auto load_result = registry_.load(specs);
    if (load_result.is_error()) {
        return load_result;
    }

    try {
        candles_ = std::make_unique<CandleStore>(config_.candles);
        detector_ = std::make_unique<SignalDetector>(config_.policy);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, e.what(), "SignalEngine");
    }

    if (!feed_) {
        auto http = std::make_shared<CurlHttpClient>(
            std::chrono::milliseconds(config_.feed.connect_timeout_ms),
            std::chrono::milliseconds(config_.feed.request_timeout_ms));
        feed_ = std::make_shared<JupiterPriceFeed>(config_.feed, http);
    }

    if (!gate_) {
        if (config_.payments.enabled) {
            auto http = std::make_shared<CurlHttpClient>(
                std::chrono::milliseconds(config_.payments.connect_timeout_ms),
                std::chrono::milliseconds(config_.payments.request_timeout_ms));
            gate_ = std::make_shared<FacilitatorPaymentGate>(config_.payments, http);
        } else {
            gate_ = std::make_shared<OpenPaymentGate>();
        }
    }

    fetch_pool_ = std::make_unique<WorkerPool>("FetchPool", config_.fetch_threads);
    analysis_pool_ = std::make_unique<WorkerPool>("AnalysisPool", config_.analysis_threads);

    quotes_ = std::make_unique<QuoteService>(config_.quotes, registry_, feed_, *candles_,
                                             *fetch_pool_);
    analyzer_ = std::make_unique<RsiAnalyzer>(config_.analysis, *candles_, *detector_,
                                              *analysis_pool_);
    poller_ = std::make_unique<MarketDataPoller>(config_.poller, registry_, *quotes_, *candles_);

    initialized_.store(true);
    INFO("Signal engine initialized with " << registry_.size() << " instruments, feed "
                                           << feed_->name() << ", payments "
                                           << (config_.payments.enabled ? "enabled"
                                                                        : "disabled"));
    return Result<void>();
}

Result<void> SignalEngine::start() {
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Signal engine not initialized",
                                "SignalEngine");
    }
    if (!config_.poller.enabled) {
        INFO("Price polling disabled");
        return Result<void>();
    }
    return poller_->start();
}

void SignalEngine::stop() {
    if (!initialized_.load()) {
        return;
    }
    // Poller first: it submits to the fetch pool
    if (poller_) {
        poller_->stop();
    }
    if (fetch_pool_) {
        fetch_pool_->shutdown();
    }
    if (analysis_pool_) {
        analysis_pool_->shutdown();
    }
}

}  // namespace signal_ngin

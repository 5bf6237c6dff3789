// src/data/market_data_poller.cpp
#include "signal_ngin/data/market_data_poller.hpp"
#include "signal_ngin/core/logger.hpp"

namespace signal_ngin {

MarketDataPoller::MarketDataPoller(PollerConfig config, const InstrumentRegistry& registry,
                                   QuoteService& quotes, CandleStore& candles)
    : config_(std::move(config)), registry_(registry), quotes_(quotes), candles_(candles) {}

MarketDataPoller::~MarketDataPoller() {
    stop();
}

Result<void> MarketDataPoller::start() {
    if (config_.interval_ms <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Poll interval must be positive, got " +
                                    std::to_string(config_.interval_ms),
                                "MarketDataPoller");
    }

    if (running_.exchange(true)) {
        WARN("Market data poller already running");
        return Result<void>();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&MarketDataPoller::run, this);

    INFO("Started price polling every " << config_.interval_ms << "ms for "
                                        << registry_.size() << " instruments");
    return Result<void>();
}

void MarketDataPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        INFO("Stopped price polling after " << completed_polls_.load() << " polls");
    }
    running_ = false;
}

size_t MarketDataPoller::poll_once() {
    size_t ingested = 0;

    for (const auto& instrument : registry_.get_all_instruments()) {
        auto quote = quotes_.get_price(*instrument);
        if (quote.is_error()) {
            WARN("Poll skipped " << instrument->get_symbol() << ": " << quote.error()->what());
            continue;
        }

        const PriceQuote& q = quote.value();
        auto ingest = candles_.ingest(q.instrument_id, q.price, q.timestamp);
        if (ingest.is_error()) {
            WARN("Rejected observation for " << instrument->get_symbol() << ": "
                                             << ingest.error()->what());
            continue;
        }
        ++ingested;
    }

    ++completed_polls_;
    DEBUG("Poll ingested " << ingested << " instruments");
    return ingested;
}

void MarketDataPoller::run() {
    Logger::register_component("MarketDataPoller");

    while (true) {
        try {
            poll_once();
        } catch (const std::exception& e) {
            ERROR("Error polling prices: " << e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                         [this] { return stop_requested_; })) {
            break;
        }
    }
}

}  // namespace signal_ngin

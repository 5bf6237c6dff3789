// src/data/quote_service.cpp
#include "signal_ngin/data/quote_service.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/core/task_group.hpp"

namespace signal_ngin {

QuoteService::QuoteService(QuoteServiceConfig config, const InstrumentRegistry& registry,
                           std::shared_ptr<PriceFeed> feed, const CandleStore& candles,
                           WorkerPool& fetch_pool, QuoteCache<PriceQuote>::Clock clock)
    : config_(std::move(config)),
      registry_(registry),
      feed_(std::move(feed)),
      candles_(candles),
      fetch_pool_(fetch_pool),
      cache_(config_.cache, std::move(clock)) {
    if (!feed_) {
        throw std::invalid_argument("QuoteService requires a price feed");
    }
}

Result<PriceQuote> QuoteService::get_price(const std::string& id_or_symbol) {
    auto instrument = registry_.resolve(id_or_symbol);
    if (instrument.is_error()) {
        return forward_error<PriceQuote>(instrument, "QuoteService");
    }
    return get_price(*instrument.value());
}

Result<PriceQuote> QuoteService::get_price(const Instrument& instrument) {
    const std::string key = cache_key(instrument.get_id());
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    auto fetched = feed_->fetch_price(instrument);
    if (fetched.is_error()) {
        return make_error<PriceQuote>(ErrorCode::UPSTREAM_FETCH_ERROR, fetched.error()->what(),
                                      "QuoteService");
    }

    PriceQuote quote = fetched.take_value();
    if (!quote.price_change_24h) {
        quote.price_change_24h = derive_change_24h(instrument.get_id(), quote.price);
    }

    cache_.put(key, quote);
    return quote;
}

Result<std::vector<PriceQuote>> QuoteService::get_current_prices(
    std::optional<InstrumentCategory> category) {
    auto instruments = category ? registry_.get_instruments_by_category(*category)
                                : registry_.get_all_instruments();
    if (instruments.empty()) {
        return std::vector<PriceQuote>();
    }

    std::vector<SettledTask<PriceQuote>> tasks;
    tasks.reserve(instruments.size());
    for (const auto& instrument : instruments) {
        tasks.push_back([this, instrument](const CancellationToken&) -> Result<PriceQuote> {
            return get_price(*instrument);
        });
    }

    auto results = gather_settled<PriceQuote>(fetch_pool_, std::move(tasks),
                                              std::chrono::milliseconds(config_.batch_timeout_ms),
                                              "QuoteService");

    std::vector<PriceQuote> quotes;
    std::string last_error;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_error()) {
            last_error = results[i].error()->what();
            WARN("Failed to fetch price for " << instruments[i]->get_symbol() << ": "
                                              << last_error);
            continue;
        }
        quotes.push_back(results[i].take_value());
    }

    if (quotes.empty()) {
        return make_error<std::vector<PriceQuote>>(
            ErrorCode::UPSTREAM_FETCH_ERROR,
            "No prices available for " + std::to_string(instruments.size()) +
                " instruments: " + last_error,
            "QuoteService");
    }
    return quotes;
}

std::optional<double> QuoteService::derive_change_24h(const std::string& instrument_id,
                                                      Price current_price) const {
    auto hourly = candles_.get_candles(instrument_id, Interval::HOUR_1, 24);
    if (hourly.is_error() || hourly.value().size() < 24) {
        return std::nullopt;
    }

    Price reference = hourly.value().front().open;
    if (reference <= 0.0) {
        return std::nullopt;
    }
    return (current_price - reference) / reference * 100.0;
}

}  // namespace signal_ngin

#include <gtest/gtest.h>
#include <memory>
#include "core/test_base.hpp"
#include "data/mock_price_feed.hpp"
#include "signal_ngin/core/worker_pool.hpp"
#include "signal_ngin/data/candle_store.hpp"
#include "signal_ngin/data/quote_service.hpp"
#include "signal_ngin/instruments/instrument_registry.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class QuoteServiceTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        ASSERT_TRUE(registry
                        .load({{"mint-btc", "WBTC", "Wrapped BTC", InstrumentCategory::WRAPPED_BTC,
                                ""},
                               {"mint-tsla", "TSLAx", "Tesla xStock",
                                InstrumentCategory::TOKENIZED_STOCK, ""},
                               {"mint-gold", "XAUT0", "Tether Gold",
                                InstrumentCategory::GOLD_TOKEN, ""}})
                        .is_ok());

        feed = std::make_shared<MockPriceFeed>();
        feed->set_price("mint-btc", 65000.0);
        feed->set_price("mint-tsla", 250.0);
        feed->set_price("mint-gold", 2400.0);

        candles = std::make_unique<CandleStore>(CandleStoreConfig());
        pool = std::make_unique<WorkerPool>("FetchPool", 2);

        QuoteServiceConfig config;
        config.cache.ttl_ms = 5000;
        service = std::make_unique<QuoteService>(config, registry, feed, *candles, *pool,
                                                 [this]() { return *now; });
    }

    void TearDown() override {
        service.reset();
        pool.reset();
        TestBase::TearDown();
    }

    InstrumentRegistry registry;
    std::shared_ptr<MockPriceFeed> feed;
    std::unique_ptr<CandleStore> candles;
    std::unique_ptr<WorkerPool> pool;
    std::unique_ptr<QuoteService> service;
    std::shared_ptr<Timestamp> now = std::make_shared<Timestamp>(std::chrono::hours(2000));
};

TEST_F(QuoteServiceTest, CachedWithinTtlRefetchedAfter) {
    auto first = service->get_price("WBTC");
    ASSERT_TRUE(first.is_ok());
    EXPECT_DOUBLE_EQ(first.value().price, 65000.0);
    EXPECT_EQ(feed->calls(), 1);

    feed->set_price("mint-btc", 66000.0);
    *now += std::chrono::milliseconds(4000);
    auto cached = service->get_price("mint-btc");
    ASSERT_TRUE(cached.is_ok());
    EXPECT_DOUBLE_EQ(cached.value().price, 65000.0);
    EXPECT_EQ(feed->calls(), 1);

    *now += std::chrono::milliseconds(1000);
    auto refreshed = service->get_price("wbtc");
    ASSERT_TRUE(refreshed.is_ok());
    EXPECT_DOUBLE_EQ(refreshed.value().price, 66000.0);
    EXPECT_EQ(feed->calls(), 2);
}

TEST_F(QuoteServiceTest, UnknownInstrumentIsNotFound) {
    auto result = service->get_price("DOGE");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSTRUMENT_NOT_FOUND);
    EXPECT_EQ(feed->calls(), 0);
}

TEST_F(QuoteServiceTest, FeedFailureSurfacesAndIsNotCached) {
    feed->set_failing("mint-gold");

    auto failed = service->get_price("XAUT0");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error()->code(), ErrorCode::UPSTREAM_FETCH_ERROR);
    EXPECT_EQ(service->cache_size(), 0u);

    feed->set_price("mint-gold", 2410.0);
    auto recovered = service->get_price("XAUT0");
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_DOUBLE_EQ(recovered.value().price, 2410.0);
    EXPECT_EQ(feed->calls(), 2);
}

TEST_F(QuoteServiceTest, BatchSkipsFailingInstruments) {
    feed->set_failing("mint-tsla");

    auto result = service->get_current_prices();
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].instrument_id, "mint-btc");
    EXPECT_EQ(result.value()[1].instrument_id, "mint-gold");
}

TEST_F(QuoteServiceTest, BatchFailsOnlyWhenEveryFetchFails) {
    feed->set_failing("mint-btc");
    feed->set_failing("mint-tsla");
    feed->set_failing("mint-gold");

    auto result = service->get_current_prices();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::UPSTREAM_FETCH_ERROR);
}

TEST_F(QuoteServiceTest, BatchFiltersByCategory) {
    auto result = service->get_current_prices(InstrumentCategory::GOLD_TOKEN);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].instrument_id, "mint-gold");
}

TEST_F(QuoteServiceTest, DerivesDailyChangeFromHourlyCandles) {
    EXPECT_FALSE(service->derive_change_24h("mint-btc", 110.0).has_value());

    // 24 hourly buckets opening at 100
    for (int h = 0; h < 24; ++h) {
        Timestamp t = hours_from_epoch(1000 + h);
        ASSERT_TRUE(candles->ingest("mint-btc", 100.0 + h, t).is_ok());
    }

    auto change = service->derive_change_24h("mint-btc", 110.0);
    ASSERT_TRUE(change.has_value());
    EXPECT_NEAR(*change, 10.0, 1e-9);

    auto quote = service->get_price("WBTC");
    ASSERT_TRUE(quote.is_ok());
    ASSERT_TRUE(quote.value().price_change_24h.has_value());
    EXPECT_NEAR(*quote.value().price_change_24h, 65000.0 - 100.0, 1e-6);
}

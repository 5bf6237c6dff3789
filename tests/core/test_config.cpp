// test_config.cpp
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "signal_ngin/core/engine_config.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;

class ConfigTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "signal_ngin_config_test";
        std::filesystem::create_directories(test_dir);
        clear_env();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        clear_env();
        TestBase::TearDown();
    }

    static void clear_env() {
        for (const char* key : {"CACHE_TTL", "MAX_CANDLES", "POLL_INTERVAL_MS",
                                "JUPITER_PRICE_API_URL", "X402_PAYMENT_ENABLED",
                                "X402_FACILITATOR_URL"}) {
            unsetenv(key);
        }
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = test_dir / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedTable) {
    auto result = ConfigLoader::load();
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const EngineConfig& config = result.value();

    EXPECT_EQ(config.quotes.cache.ttl_ms, 5000);
    EXPECT_EQ(config.candles.max_candles, 1000u);
    EXPECT_EQ(config.poller.interval_ms, 5000);
    EXPECT_EQ(config.feed.base_url, "https://lite-api.jup.ag/price/v3");
    EXPECT_FALSE(config.payments.enabled);
    EXPECT_TRUE(config.instruments.empty());

    const auto& gold = config.policy.for_category(InstrumentCategory::GOLD_TOKEN);
    EXPECT_EQ(gold.rsi_period, 14);
    EXPECT_DOUBLE_EQ(gold.oversold, 25.0);
    EXPECT_DOUBLE_EQ(gold.overbought, 75.0);

    const auto& stocks = config.policy.for_category(InstrumentCategory::TOKENIZED_STOCK);
    EXPECT_DOUBLE_EQ(stocks.oversold, 35.0);
    EXPECT_EQ(stocks.default_interval, Interval::MINUTE_5);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    EngineConfig config;
    config.candles.max_candles = 250;
    config.analysis.mtf_intervals = {Interval::MINUTE_1, Interval::HOUR_1};
    config.payments.pricing["get-ohlc-stats"].amount = 7000;
    config.fetch_threads = 2;

    std::filesystem::path path = test_dir / "engine.json";
    ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

    EngineConfig loaded;
    auto load_result = loaded.load_from_file(path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->to_string();

    EXPECT_EQ(loaded.candles.max_candles, 250u);
    ASSERT_EQ(loaded.analysis.mtf_intervals.size(), 2u);
    EXPECT_EQ(loaded.analysis.mtf_intervals[0], Interval::MINUTE_1);
    EXPECT_EQ(loaded.payments.pricing["get-ohlc-stats"].amount, 7000);
    EXPECT_EQ(loaded.fetch_threads, 2u);
}

TEST_F(ConfigTest, FileIsMergedOverDefaults) {
    auto path = write_file("partial.json", R"({
        "quotes": {"cache": {"ttl_ms": 1500}},
        "policy": {"categories": {"gold": {"oversold": 20}}},
        "instruments": [
            {"id": "mint-1", "symbol": "ABC", "name": "Abc Token", "category": "rwa-stocks"}
        ]
    })");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const EngineConfig& config = result.value();

    EXPECT_EQ(config.quotes.cache.ttl_ms, 1500);
    EXPECT_EQ(config.quotes.cache.max_entries, 100u);
    EXPECT_EQ(config.quotes.batch_timeout_ms, 10000);

    const auto& gold = config.policy.for_category(InstrumentCategory::GOLD_TOKEN);
    EXPECT_DOUBLE_EQ(gold.oversold, 20.0);
    EXPECT_DOUBLE_EQ(gold.overbought, 75.0);

    ASSERT_EQ(config.instruments.size(), 1u);
    EXPECT_EQ(config.instruments[0].symbol, "ABC");
    EXPECT_EQ(config.instruments[0].category, InstrumentCategory::TOKENIZED_STOCK);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = write_file("poll.json", R"({"poller": {"interval_ms": 9000}})");
    setenv("CACHE_TTL", "2500", 1);
    setenv("MAX_CANDLES", "300", 1);
    setenv("POLL_INTERVAL_MS", "1000", 1);
    setenv("JUPITER_PRICE_API_URL", "http://localhost:8080/price", 1);
    setenv("X402_PAYMENT_ENABLED", "true", 1);
    setenv("X402_FACILITATOR_URL", "http://localhost:9090", 1);

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const EngineConfig& config = result.value();

    EXPECT_EQ(config.quotes.cache.ttl_ms, 2500);
    EXPECT_EQ(config.candles.max_candles, 300u);
    EXPECT_EQ(config.poller.interval_ms, 1000);
    EXPECT_EQ(config.feed.base_url, "http://localhost:8080/price");
    EXPECT_TRUE(config.payments.enabled);
    EXPECT_EQ(config.payments.facilitator_url, "http://localhost:9090");
}

TEST_F(ConfigTest, MalformedEnvironmentNumberIsRejected) {
    setenv("MAX_CANDLES", "lots", 1);
    auto result = ConfigLoader::load();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, LoadErrorsAreTyped) {
    auto missing = ConfigLoader::load(test_dir / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);

    auto broken = ConfigLoader::load(write_file("broken.json", "{ \"poller\": "));
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto bad_category =
        ConfigLoader::load(write_file("category.json", R"({"policy": {"categories": {"silver": {}}}})"));
    ASSERT_TRUE(bad_category.is_error());
    EXPECT_EQ(bad_category.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto bad_thresholds = ConfigLoader::load(write_file(
        "thresholds.json",
        R"({"policy": {"categories": {"wrapped-btc": {"oversold": 80, "overbought": 70}}}})"));
    ASSERT_TRUE(bad_thresholds.is_error());
    EXPECT_EQ(bad_thresholds.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, MergeJsonIsDeep) {
    nlohmann::json target = {{"a", {{"x", 1}, {"y", 2}}}, {"b", 3}};
    nlohmann::json source = {{"a", {{"y", 20}, {"z", 30}}}, {"c", 4}};

    ConfigBase::merge_json(target, source);

    EXPECT_EQ(target["a"]["x"], 1);
    EXPECT_EQ(target["a"]["y"], 20);
    EXPECT_EQ(target["a"]["z"], 30);
    EXPECT_EQ(target["b"], 3);
    EXPECT_EQ(target["c"], 4);
}

TEST_F(ConfigTest, RejectedOverridesLeaveValuesUntouched) {
    EngineConfig config;
    ASSERT_TRUE(config.apply_overrides({{"poller", {{"interval_ms", 2000}}}}).is_ok());
    EXPECT_EQ(config.poller.interval_ms, 2000);

    auto rejected = config.apply_overrides(
        {{"poller", {{"interval_ms", 7000}}}, {"policy", {{"categories", {{"silver", {}}}}}}});
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(config.poller.interval_ms, 2000);

    EXPECT_TRUE(config.apply_overrides(nlohmann::json::array()).is_error());
}

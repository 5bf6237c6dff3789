#include <gtest/gtest.h>
#include "core/test_base.hpp"
#include "data/mock_http_client.hpp"
#include "signal_ngin/service/payment_gate.hpp"

using namespace signal_ngin;
using namespace signal_ngin::testing;
using ::testing::_;

class PaymentGateTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        config.enabled = true;
        config.facilitator_url = "https://facilitator.test";
        http = std::make_shared<::testing::StrictMock<MockHttpClient>>();
        gate = std::make_unique<FacilitatorPaymentGate>(config, http);
    }

    static RequestContext with_payment(const std::string& value) {
        RequestContext context;
        context.headers["x-payment"] = value;
        return context;
    }

    PaymentConfig config;
    std::shared_ptr<::testing::StrictMock<MockHttpClient>> http;
    std::unique_ptr<FacilitatorPaymentGate> gate;
};

TEST_F(PaymentGateTest, OpenGateGrantsEverything) {
    OpenPaymentGate open;
    auto decision = open.authorize("get-portfolio-signals", RequestContext{});
    EXPECT_TRUE(decision.granted);
    EXPECT_EQ(decision.reason, "Payments disabled");
}

TEST_F(PaymentGateTest, MissingHeaderIsDeniedWithoutNetwork) {
    auto decision = gate->authorize("get-rsi-analysis", RequestContext{});
    EXPECT_FALSE(decision.granted);
    EXPECT_EQ(decision.reason, "Payment required: missing X-PAYMENT header");

    auto empty = gate->authorize("get-rsi-analysis", with_payment(""));
    EXPECT_FALSE(empty.granted);
}

TEST_F(PaymentGateTest, UnpricedOperationIsDenied) {
    auto decision = gate->authorize("get-everything", with_payment("token"));
    EXPECT_FALSE(decision.granted);
    EXPECT_EQ(decision.reason, "No pricing configured for operation: get-everything");
}

TEST_F(PaymentGateTest, VerifiedPaymentIsGranted) {
    EXPECT_CALL(*http, post("https://facilitator.test/verify", _, _))
        .WillOnce([](const std::string&, const std::string& payload,
                     const std::vector<std::string>&) {
            auto request = nlohmann::json::parse(payload);
            EXPECT_EQ(request["paymentHeader"], "signed-payload");
            EXPECT_EQ(request["operation"], "get-rsi-analysis");
            EXPECT_EQ(request["amount"], "50000");
            EXPECT_EQ(request["network"], "solana");
            EXPECT_EQ(request["resource"], "mcp://tools/get-rsi-analysis");
            return http_ok(R"({"isValid": true})");
        });

    auto decision = gate->authorize("get-rsi-analysis", with_payment("signed-payload"));
    EXPECT_TRUE(decision.granted);
    EXPECT_EQ(decision.reason, "Payment verified");
}

TEST_F(PaymentGateTest, FacilitatorFailuresDeny) {
    EXPECT_CALL(*http, post(_, _, _))
        .WillOnce([](const std::string&, const std::string&, const std::vector<std::string>&) {
            return http_ok(R"({"isValid": false, "invalidReason": "insufficient_funds"})");
        })
        .WillOnce([](const std::string&, const std::string&, const std::vector<std::string>&) {
            return http_status(402);
        })
        .WillOnce([](const std::string&, const std::string&, const std::vector<std::string>&) {
            return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "connection refused",
                                            "CurlHttpClient");
        })
        .WillOnce([](const std::string&, const std::string&, const std::vector<std::string>&) {
            return http_ok("<html>");
        });

    auto invalid = gate->authorize("get-ohlc-data", with_payment("p"));
    EXPECT_FALSE(invalid.granted);
    EXPECT_EQ(invalid.reason, "Payment invalid: insufficient_funds");

    auto rejected = gate->authorize("get-ohlc-data", with_payment("p"));
    EXPECT_FALSE(rejected.granted);
    EXPECT_EQ(rejected.reason, "Facilitator rejected payment (HTTP 402)");

    auto unreachable = gate->authorize("get-ohlc-data", with_payment("p"));
    EXPECT_FALSE(unreachable.granted);
    EXPECT_EQ(unreachable.reason, "Payment verification failed: connection refused");

    auto garbled = gate->authorize("get-ohlc-data", with_payment("p"));
    EXPECT_FALSE(garbled.granted);
}

TEST_F(PaymentGateTest, PricingFormatsAsUsdc) {
    EXPECT_EQ(PaymentConfig::format_price(50000), "$0.050 USDC");
    EXPECT_EQ(PaymentConfig::format_price(100000), "$0.100 USDC");

    ASSERT_TRUE(config.price_of("get-ohlc-stats").has_value());
    EXPECT_EQ(config.price_of("get-ohlc-stats")->formatted(), "$0.005 USDC");
    EXPECT_FALSE(config.price_of("unknown").has_value());
}

TEST_F(PaymentGateTest, HeaderLookupIgnoresCase) {
    RequestContext context;
    context.headers["X-Payment"] = "abc";
    ASSERT_TRUE(context.header("x-payment").has_value());
    EXPECT_EQ(*context.header("X-PAYMENT"), "abc");
    EXPECT_FALSE(context.header("Authorization").has_value());
}

TEST_F(PaymentGateTest, RequiresHttpClient) {
    EXPECT_THROW(FacilitatorPaymentGate(config, nullptr), std::invalid_argument);
}

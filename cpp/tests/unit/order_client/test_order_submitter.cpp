#include "doctest.h"
#include "../../../order_client/order_submitter.hpp"

namespace {

// Exchange that returns a preset outcome and counts calls
class ScriptedExchangeOMS : public IExchangeOMS {
public:
    error_handling::Result<OrderOutcome> place_order(const oms::NormalizedOrderRequest& request) override {
        ++calls;
        last_request = request;
        return outcome;
    }

    std::string exchange_name() const override { return "binance"; }
    std::string base_url() const override { return "https://testnet.binancefuture.com"; }

    error_handling::Result<OrderOutcome> outcome =
        error_handling::Result<OrderOutcome>::error(error_handling::submission_error("not scripted"));
    std::optional<oms::NormalizedOrderRequest> last_request;
    int calls{0};
};

struct SubmitterFixture {
    ScriptedExchangeOMS exchange;
    std::shared_ptr<logging::LogManager> log_manager = std::make_shared<logging::LogManager>();
    std::shared_ptr<logging::MemorySink> log_sink = std::make_shared<logging::MemorySink>();

    SubmitterFixture() { log_manager->add_sink(log_sink); }

    order_client::OrderSubmitter make_submitter() {
        return order_client::OrderSubmitter(exchange, logging::Logger(log_manager, "ORDER_SUBMITTER"));
    }
};

} // namespace

TEST_CASE("OrderSubmitter - Success logs request, params and response") {
    SubmitterFixture fixture;
    OrderOutcome response;
    response.document["orderId"] = 42;
    response.document["status"] = "NEW";
    response.body = "{\"status\": \"NEW\",\n \"orderId\": 42, \"avgPrice\": 0.10}";
    fixture.exchange.outcome = error_handling::Result<OrderOutcome>::success(response);

    auto submitter = fixture.make_submitter();
    auto result = submitter.submit(oms::MarketOrderRequest{"BTCUSDT", oms::Side::BUY, 0.001});

    REQUIRE(result.is_success());
    CHECK(result.value().document["orderId"].asInt() == 42);
    CHECK(fixture.exchange.calls == 1);
    REQUIRE(fixture.exchange.last_request.has_value());
    CHECK(std::holds_alternative<oms::MarketOrderRequest>(*fixture.exchange.last_request));

    const auto& lines = fixture.log_sink->lines();
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].find(R"([INFO] [ORDER_SUBMITTER] Placing order: {"symbol": "BTCUSDT", "side": "BUY", "type": "MARKET", "quantity": 0.001})") != std::string::npos);
    CHECK(lines[1].find(R"(Order params: {"symbol": "BTCUSDT")") != std::string::npos);
    CHECK(lines[2].find(R"(Order response: {"status":"NEW","orderId":42,"avgPrice":0.10})") != std::string::npos);
}

TEST_CASE("OrderSubmitter - Failure is logged and returned unchanged") {
    SubmitterFixture fixture;
    fixture.exchange.outcome = error_handling::Result<OrderOutcome>::error(
        error_handling::submission_error("Invalid API-key, IP, or permissions for action.", -2015, 401));

    auto submitter = fixture.make_submitter();
    auto result = submitter.submit(oms::LimitOrderRequest{"ETHUSDT", oms::Side::SELL, 0.5, 2500.0, oms::TimeInForce::IOC});

    REQUIRE(result.is_error());
    CHECK(result.error().kind == error_handling::ErrorKind::SUBMISSION);
    CHECK(result.error().code == -2015);
    CHECK(result.error().http_status == 401);
    CHECK(fixture.exchange.calls == 1);

    const auto& lines = fixture.log_sink->lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].find(R"("price": 2500, "timeInForce": "IOC"})") != std::string::npos);
    CHECK(fixture.log_sink->levels()[1] == logging::LogLevel::ERROR);
    CHECK(lines[1].find("[ERROR] [ORDER_SUBMITTER] Binance API error (code -2015, HTTP 401): "
                        "Invalid API-key, IP, or permissions for action.") != std::string::npos);
    CHECK_FALSE(fixture.log_sink->contains("Order response"));
}

TEST_CASE("OrderSubmitter - Transport failure description") {
    SubmitterFixture fixture;
    auto submitter = fixture.make_submitter();

    CHECK(submitter.describe_error(error_handling::submission_error("CURL error: Timeout was reached")) ==
          "Binance API error (code 0): CURL error: Timeout was reached");
}

TEST_CASE("OrderSubmitter - Compact JSON") {
    Json::Value value;
    value["a"] = 1;
    value["b"] = "x";
    CHECK(order_client::OrderSubmitter::to_compact_json(value) == R"({"a":1,"b":"x"})");
}

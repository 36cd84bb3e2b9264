#include "doctest.h"
#include "../../../exchanges/binance/http/binance_futures_oms.hpp"
#include "../../../utils/oms/order_builder.hpp"
#include "../../mocks/mock_http_handler.hpp"

namespace {

constexpr int64_t kFixedTimestamp = 1499827319559;

struct BinanceOmsFixture {
    std::shared_ptr<MockHttpHandler> http = std::make_shared<MockHttpHandler>();
    std::shared_ptr<logging::LogManager> log_manager = std::make_shared<logging::LogManager>(logging::LogLevel::DEBUG);
    std::shared_ptr<logging::MemorySink> log_sink = std::make_shared<logging::MemorySink>();
    binance::BinanceConfig config;

    BinanceOmsFixture() {
        config.api_key = "test_api_key";
        config.api_secret = "test_api_secret";
        config.base_url = "https://testnet.binancefuture.com";
        log_manager->add_sink(log_sink);
    }

    std::unique_ptr<binance::BinanceFuturesOMS> make_oms() {
        auto oms = std::make_unique<binance::BinanceFuturesOMS>(config, http, logging::Logger(log_manager, "BINANCE"));
        oms->set_clock([]() { return kFixedTimestamp; });
        return oms;
    }
};

oms::NormalizedOrderRequest sample_market_order() {
    return oms::MarketOrderRequest{"BTCUSDT", oms::Side::BUY, 0.001};
}

oms::NormalizedOrderRequest sample_limit_order() {
    return oms::LimitOrderRequest{"BTCUSDT", oms::Side::SELL, 0.002, 30000.0, oms::TimeInForce::GTC};
}

} // namespace

TEST_CASE("BinanceFuturesOMS - HMAC-SHA256 signature") {
    BinanceOmsFixture fixture;
    fixture.config.api_secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
    auto oms = fixture.make_oms();

    const std::string query =
        "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1&recvWindow=5000&timestamp=1499827319559";
    CHECK(oms->generate_signature(query) == "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
}

TEST_CASE("BinanceFuturesOMS - Signed query layout") {
    BinanceOmsFixture fixture;
    auto oms = fixture.make_oms();

    const std::string query = oms->build_signed_query(oms::to_order_params(sample_limit_order()), kFixedTimestamp);
    const std::string unsigned_part =
        "symbol=BTCUSDT&side=SELL&type=LIMIT&quantity=0.002&price=30000&timeInForce=GTC"
        "&recvWindow=5000&timestamp=1499827319559";

    REQUIRE(query.find(unsigned_part + "&signature=") == 0);
    const std::string signature = query.substr(unsigned_part.size() + std::string("&signature=").size());
    CHECK(signature.size() == 64);
    CHECK(signature == oms->generate_signature(unsigned_part));
}

TEST_CASE("BinanceFuturesOMS - Successful order") {
    BinanceOmsFixture fixture;
    fixture.config.recv_window_ms = 6000;
    fixture.config.timeout_ms = 2500;
    fixture.http->enqueue_json(200, R"({"orderId":12345,"status":"NEW","symbol":"BTCUSDT"})");
    auto oms = fixture.make_oms();

    auto result = oms->place_order(sample_market_order());

    REQUIRE(result.is_success());
    CHECK(result.value().document["orderId"].asInt64() == 12345);
    CHECK(result.value().document["status"].asString() == "NEW");
    CHECK(result.value().body == R"({"orderId":12345,"status":"NEW","symbol":"BTCUSDT"})");

    REQUIRE(fixture.http->call_count() == 1);
    const HttpRequest& request = fixture.http->last_request();
    CHECK(request.method == "POST");
    CHECK(request.url == "https://testnet.binancefuture.com/fapi/v1/order");
    CHECK(request.headers.at("X-MBX-APIKEY") == "test_api_key");
    CHECK(request.headers.at("Content-Type") == "application/x-www-form-urlencoded");
    CHECK(request.timeout_ms == 2500);
    CHECK(request.body.find("symbol=BTCUSDT&side=BUY&type=MARKET&quantity=0.001&recvWindow=6000&timestamp=1499827319559&signature=") == 0);
    CHECK(request.body.find("price") == std::string::npos);
    CHECK(fixture.http->is_initialized());

    CHECK(fixture.log_sink->contains("[DEBUG] [BINANCE] POST https://testnet.binancefuture.com/fapi/v1/order"));
}

TEST_CASE("BinanceFuturesOMS - Exchange rejection") {
    BinanceOmsFixture fixture;
    fixture.http->enqueue_json(400, R"({"code":-1111,"msg":"Precision is over the maximum defined for this asset."})");
    auto oms = fixture.make_oms();

    auto result = oms->place_order(sample_limit_order());

    REQUIRE(result.is_error());
    CHECK(result.error().kind == error_handling::ErrorKind::SUBMISSION);
    CHECK(result.error().code == -1111);
    CHECK(result.error().http_status == 400);
    CHECK(result.error().message == "Precision is over the maximum defined for this asset.");
    CHECK(fixture.http->call_count() == 1);
}

TEST_CASE("BinanceFuturesOMS - Error document with HTTP 200") {
    BinanceOmsFixture fixture;
    fixture.http->enqueue_json(200, R"({"code":-2019,"msg":"Margin is insufficient."})");
    auto oms = fixture.make_oms();

    auto result = oms->place_order(sample_market_order());

    REQUIRE(result.is_error());
    CHECK(result.error().code == -2019);
    CHECK(result.error().http_status == 200);
    CHECK(result.error().message == "Margin is insufficient.");
}

TEST_CASE("BinanceFuturesOMS - Network failure") {
    BinanceOmsFixture fixture;
    fixture.http->enable_network_failure(true, "CURL error: Timeout was reached");
    auto oms = fixture.make_oms();

    auto result = oms->place_order(sample_market_order());

    REQUIRE(result.is_error());
    CHECK(result.error().kind == error_handling::ErrorKind::SUBMISSION);
    CHECK(result.error().code == 0);
    CHECK(result.error().http_status == 0);
    CHECK(result.error().message == "CURL error: Timeout was reached");
    CHECK(fixture.http->call_count() == 1);
}

TEST_CASE("BinanceFuturesOMS - Unparseable bodies") {
    BinanceOmsFixture fixture;

    SUBCASE("non-JSON error body") {
        fixture.http->enqueue_json(502, "<html>Bad Gateway</html>");
        auto result = fixture.make_oms()->place_order(sample_market_order());
        REQUIRE(result.is_error());
        CHECK(result.error().message == "HTTP 502: <html>Bad Gateway</html>");
        CHECK(result.error().http_status == 502);
        CHECK(result.error().code == 0);
    }

    SUBCASE("non-JSON success body") {
        fixture.http->enqueue_json(200, "OK");
        auto result = fixture.make_oms()->place_order(sample_market_order());
        REQUIRE(result.is_error());
        CHECK(result.error().message == "Invalid response from exchange: OK");
    }
}

TEST_CASE("BinanceFuturesOMS - parse_error without body") {
    HttpResponse response;
    response.status_code = 0;
    CHECK(binance::BinanceFuturesOMS::parse_error(response).message == "No response from exchange");

    response.status_code = 503;
    auto error = binance::BinanceFuturesOMS::parse_error(response);
    CHECK(error.message == "HTTP 503");
    CHECK(error.http_status == 503);
}

TEST_CASE("BinanceFuturesOMS - Identity") {
    BinanceOmsFixture fixture;
    fixture.config.base_url = "http://localhost:9000";
    auto oms = fixture.make_oms();
    CHECK(oms->exchange_name() == "binance");
    CHECK(oms->base_url() == "http://localhost:9000");
}

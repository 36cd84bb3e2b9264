#pragma once
#include "../../i_exchange_oms.hpp"
#include "../../../utils/http/i_http_handler.hpp"
#include "../../../utils/logging/logger.hpp"
#include "../../../utils/constants.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace binance {

// Binance USDT-M futures REST configuration
struct BinanceConfig {
    std::string api_key;
    std::string api_secret;
    std::string base_url{constants::exchange::binance::TESTNET_HTTP_URL};
    int recv_window_ms{constants::exchange::binance::DEFAULT_RECV_WINDOW_MS};
    int timeout_ms{constants::timeout::DEFAULT_HTTP_MS};
};

/**
 * Places orders through POST /fapi/v1/order.
 *
 * Requests are form-encoded and signed with HMAC-SHA256 over the query
 * string (order params, recvWindow, timestamp). The API key travels in
 * the X-MBX-APIKEY header.
 */
class BinanceFuturesOMS : public IExchangeOMS {
public:
    using Clock = std::function<int64_t()>;

    BinanceFuturesOMS(const BinanceConfig& config, std::shared_ptr<IHttpHandler> http_handler,
                      logging::Logger logger);

    error_handling::Result<OrderOutcome> place_order(const oms::NormalizedOrderRequest& request) override;

    std::string exchange_name() const override { return constants::exchange::binance::NAME; }
    std::string base_url() const override { return config_.base_url; }

    // Signed form body for the given params at timestamp_ms
    std::string build_signed_query(const oms::OrderParams& params, int64_t timestamp_ms) const;
    std::string generate_signature(const std::string& data) const;

    // Translate a non-success HTTP exchange into a SUBMISSION error
    static error_handling::Error parse_error(const HttpResponse& response);

    // Millisecond clock used for the timestamp parameter
    void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
    BinanceConfig config_;
    std::shared_ptr<IHttpHandler> http_handler_;
    logging::Logger logger_;
    Clock clock_;

    static std::string url_encode(const std::string& value);
    static int64_t now_ms();
};

} // namespace binance

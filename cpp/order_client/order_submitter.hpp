#pragma once
#include <string>
#include "../exchanges/i_exchange_oms.hpp"
#include "../utils/logging/logger.hpp"

namespace order_client {

/**
 * Order Submitter
 *
 * Sends one normalized request to the exchange and records the attempt
 * and its outcome on the logger. Exactly one place_order() per submit();
 * failures are returned as received from the exchange.
 */
class OrderSubmitter {
public:
    OrderSubmitter(IExchangeOMS& oms, logging::Logger logger);

    error_handling::Result<OrderOutcome> submit(const oms::NormalizedOrderRequest& request);

    // Single-line rendering used in log lines
    static std::string to_compact_json(const Json::Value& value);

    // Human-readable error line, e.g. "Binance API error (code -2015, HTTP 401): Invalid API-key"
    std::string describe_error(const error_handling::Error& error) const;

private:
    IExchangeOMS& oms_;
    logging::Logger logger_;
};

} // namespace order_client

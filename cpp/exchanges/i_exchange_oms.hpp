#pragma once
#include <string>
#include <json/json.h>
#include "../utils/error_handling.hpp"
#include "../utils/oms/order.hpp"

// Exchange response to an order placement
struct OrderOutcome {
    Json::Value document;   // parsed, for field lookups
    std::string body;       // as received, for display
};

/**
 * IExchangeOMS - Order placement interface
 *
 * Purpose: the remote side of a single order submission
 * Used by: order_client::OrderSubmitter
 *
 * Key Design:
 * - One call to place_order() is one request on the wire; implementations
 *   never retry
 * - Exchange rejections come back as SUBMISSION errors carrying the
 *   exchange's own code and message
 * - Credentials and endpoint are owned by the implementation
 */
class IExchangeOMS {
public:
    virtual ~IExchangeOMS() = default;

    virtual error_handling::Result<OrderOutcome> place_order(const oms::NormalizedOrderRequest& request) = 0;

    virtual std::string exchange_name() const = 0;
    virtual std::string base_url() const = 0;
};

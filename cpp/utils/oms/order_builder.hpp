#pragma once
#include <string>
#include "order.hpp"
#include "../error_handling.hpp"

namespace oms {

/**
 * Validate a raw order intent and produce the normalized request.
 *
 * Symbol, side and type are upper-cased. Any positive finite quantity or
 * price is accepted and sent as given; precision limits are the
 * exchange's to enforce. LIMIT requires a price and carries a
 * time-in-force (GTC when unspecified). MARKET drops any price or
 * time-in-force without complaint. Pure: no logging, no I/O.
 *
 * @return the request, or a VALIDATION error naming the offending field
 */
error_handling::Result<NormalizedOrderRequest> build_order_request(const OrderIntent& intent);

// Wire field list in contract order
OrderParams to_order_params(const NormalizedOrderRequest& request);

// Single-line JSON object, fields in contract order
std::string to_json(const OrderParams& params);

// Shortest plain decimal (no exponent) that parses back to the same double
std::string format_decimal(double value);

} // namespace oms

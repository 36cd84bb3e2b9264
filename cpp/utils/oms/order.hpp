#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "types.hpp"

namespace oms {

// Order as typed by the user, before validation
struct OrderIntent {
  std::string symbol;          // e.g. "btcusdt", normalized to upper case
  std::string side;            // "BUY" / "SELL"
  std::string order_type;      // "MARKET" / "LIMIT"
  double quantity{0.0};
  std::optional<double> price; // required for LIMIT
  std::string time_in_force;   // empty means GTC; LIMIT only
};

struct MarketOrderRequest {
  std::string symbol;
  Side side{Side::BUY};
  double quantity{0.0};
};

struct LimitOrderRequest {
  std::string symbol;
  Side side{Side::BUY};
  double quantity{0.0};
  double price{0.0};
  TimeInForce time_in_force{TimeInForce::GTC};
};

// Exactly the field set sent to the exchange
using NormalizedOrderRequest = std::variant<MarketOrderRequest, LimitOrderRequest>;

struct OrderParam {
  std::string name;
  std::string value;
  bool numeric{false};         // rendered without quotes in JSON
};

// Ordered: symbol, side, type, quantity[, price, timeInForce]
using OrderParams = std::vector<OrderParam>;

} // namespace oms

#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace oms {

enum class Side { BUY, SELL };

enum class OrderType { MARKET, LIMIT };

enum class TimeInForce { GTC, IOC, FOK };

inline const char* to_string(Side s) {
  return s == Side::BUY ? "BUY" : "SELL";
}

inline const char* to_string(OrderType t) {
  switch (t) {
    case OrderType::MARKET: return "MARKET";
    case OrderType::LIMIT: return "LIMIT";
  }
  return "UNKNOWN";
}

inline const char* to_string(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::GTC: return "GTC";
    case TimeInForce::IOC: return "IOC";
    case TimeInForce::FOK: return "FOK";
  }
  return "UNKNOWN";
}

inline std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

// Parsers are case-insensitive; nullopt for anything outside the enum
inline std::optional<Side> parse_side(const std::string& value) {
  const std::string upper = to_upper(value);
  if (upper == "BUY") return Side::BUY;
  if (upper == "SELL") return Side::SELL;
  return std::nullopt;
}

inline std::optional<OrderType> parse_order_type(const std::string& value) {
  const std::string upper = to_upper(value);
  if (upper == "MARKET") return OrderType::MARKET;
  if (upper == "LIMIT") return OrderType::LIMIT;
  return std::nullopt;
}

inline std::optional<TimeInForce> parse_time_in_force(const std::string& value) {
  const std::string upper = to_upper(value);
  if (upper == "GTC") return TimeInForce::GTC;
  if (upper == "IOC") return TimeInForce::IOC;
  if (upper == "FOK") return TimeInForce::FOK;
  return std::nullopt;
}

} // namespace oms

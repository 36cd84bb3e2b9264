#include "order_builder.hpp"
#include "../constants.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <json/writer.h>

namespace oms {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool is_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

error_handling::Result<NormalizedOrderRequest> reject(const std::string& message) {
    return error_handling::Result<NormalizedOrderRequest>::error(error_handling::validation_error(message));
}

} // namespace

error_handling::Result<NormalizedOrderRequest> build_order_request(const OrderIntent& intent) {
    const std::string symbol = to_upper(trim(intent.symbol));
    if (symbol.empty()) {
        return reject("Symbol is required");
    }

    auto side = parse_side(intent.side);
    if (!side) {
        return reject("Unsupported order side: " + intent.side);
    }

    auto type = parse_order_type(intent.order_type);
    if (!type) {
        return reject("Unsupported order type: " + intent.order_type);
    }

    if (!is_positive(intent.quantity)) {
        return reject("Quantity must be positive");
    }

    switch (*type) {
        case OrderType::MARKET:
            return error_handling::Result<NormalizedOrderRequest>::success(
                MarketOrderRequest{symbol, *side, intent.quantity});

        case OrderType::LIMIT: {
            if (!intent.price) {
                return reject("Limit orders require price");
            }
            if (!is_positive(*intent.price)) {
                return reject("Price must be positive");
            }

            TimeInForce tif = TimeInForce::GTC;
            if (!intent.time_in_force.empty()) {
                auto parsed = parse_time_in_force(intent.time_in_force);
                if (!parsed) {
                    return reject("Unsupported time in force: " + intent.time_in_force);
                }
                tif = *parsed;
            }

            return error_handling::Result<NormalizedOrderRequest>::success(
                LimitOrderRequest{symbol, *side, intent.quantity, *intent.price, tif});
        }
    }

    return reject("Unsupported order type: " + intent.order_type);
}

OrderParams to_order_params(const NormalizedOrderRequest& request) {
    OrderParams params;

    if (const auto* market = std::get_if<MarketOrderRequest>(&request)) {
        params.push_back({"symbol", market->symbol, false});
        params.push_back({"side", to_string(market->side), false});
        params.push_back({"type", to_string(OrderType::MARKET), false});
        params.push_back({"quantity", format_decimal(market->quantity), true});
    } else if (const auto* limit = std::get_if<LimitOrderRequest>(&request)) {
        params.push_back({"symbol", limit->symbol, false});
        params.push_back({"side", to_string(limit->side), false});
        params.push_back({"type", to_string(OrderType::LIMIT), false});
        params.push_back({"quantity", format_decimal(limit->quantity), true});
        params.push_back({"price", format_decimal(limit->price), true});
        params.push_back({"timeInForce", to_string(limit->time_in_force), false});
    }

    return params;
}

std::string to_json(const OrderParams& params) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& param : params) {
        if (!first) out << ", ";
        out << Json::valueToQuotedString(param.name.c_str()) << ": ";
        if (param.numeric) {
            out << param.value;
        } else {
            out << Json::valueToQuotedString(param.value.c_str());
        }
        first = false;
    }
    out << "}";
    return out.str();
}

std::string format_decimal(double value) {
    if (!std::isfinite(value)) {
        return std::to_string(value);
    }

    // Fewest fractional digits that read back as the same double
    std::string text;
    for (int digits = 0; digits <= constants::order::MAX_FRACTION_DIGITS; ++digits) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(digits) << value;
        text = out.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }

    if (text == "-0") {
        text = "0";
    }
    return text;
}

} // namespace oms

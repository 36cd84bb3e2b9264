#include "order_submitter.hpp"
#include "json_text.hpp"
#include "../utils/oms/order_builder.hpp"
#include <cctype>
#include <json/json.h>

namespace order_client {

OrderSubmitter::OrderSubmitter(IExchangeOMS& oms, logging::Logger logger)
    : oms_(oms), logger_(std::move(logger)) {
}

error_handling::Result<OrderOutcome> OrderSubmitter::submit(const oms::NormalizedOrderRequest& request) {
    const std::string params_json = oms::to_json(oms::to_order_params(request));

    logger_.info("Placing order: " + params_json);

    auto result = oms_.place_order(request);

    if (result.is_error()) {
        logger_.error(describe_error(result.error()));
        return result;
    }

    logger_.info("Order params: " + params_json);
    logger_.info("Order response: " + format_json_text(result.value().body, 0));
    return result;
}

std::string OrderSubmitter::to_compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

std::string OrderSubmitter::describe_error(const error_handling::Error& error) const {
    std::string exchange = oms_.exchange_name();
    if (!exchange.empty()) {
        exchange[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(exchange[0])));
    }

    std::string line = exchange + " API error (code " + std::to_string(error.code);
    if (error.http_status != 0) {
        line += ", HTTP " + std::to_string(error.http_status);
    }
    line += "): " + error.message;
    return line;
}

} // namespace order_client

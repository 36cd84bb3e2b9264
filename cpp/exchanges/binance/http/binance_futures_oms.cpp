#include "binance_futures_oms.hpp"
#include "../../../utils/oms/order_builder.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <json/json.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace binance {

BinanceFuturesOMS::BinanceFuturesOMS(const BinanceConfig& config, std::shared_ptr<IHttpHandler> http_handler,
                                     logging::Logger logger)
    : config_(config), http_handler_(std::move(http_handler)), logger_(std::move(logger)), clock_(&BinanceFuturesOMS::now_ms) {
}

error_handling::Result<OrderOutcome> BinanceFuturesOMS::place_order(const oms::NormalizedOrderRequest& request) {
    using ResultT = error_handling::Result<OrderOutcome>;

    if (!http_handler_) {
        return ResultT::error(error_handling::submission_error("HTTP handler not configured"));
    }
    if (!http_handler_->is_initialized() && !http_handler_->initialize()) {
        return ResultT::error(error_handling::submission_error("Failed to initialize HTTP handler"));
    }

    HttpRequest http_request;
    http_request.method = "POST";
    http_request.url = config_.base_url + constants::exchange::binance::ORDER_ENDPOINT;
    http_request.headers[constants::exchange::binance::API_KEY_HEADER] = config_.api_key;
    http_request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    http_request.body = build_signed_query(oms::to_order_params(request), clock_());
    http_request.timeout_ms = config_.timeout_ms;

    logger_.debug("POST " + http_request.url);

    HttpResponse response = http_handler_->make_request(http_request);

    logger_.debug("HTTP status " + std::to_string(response.status_code));

    if (response.status_code == 0 || !response.success) {
        return ResultT::error(parse_error(response));
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream body_stream(response.body);

    if (!Json::parseFromStream(builder, body_stream, &root, &errors) || !root.isObject()) {
        return ResultT::error(error_handling::submission_error(
            "Invalid response from exchange: " + response.body, 0, response.status_code));
    }

    // Some gateways answer 200 with an error document
    if (root.isMember("code") && root["code"].isInt() && root["code"].asInt() < 0 && root.isMember("msg")) {
        return ResultT::error(error_handling::submission_error(
            root["msg"].asString(), root["code"].asInt(), response.status_code));
    }

    return ResultT::success(OrderOutcome{root, response.body});
}

std::string BinanceFuturesOMS::build_signed_query(const oms::OrderParams& params, int64_t timestamp_ms) const {
    std::string query;
    for (const auto& param : params) {
        if (!query.empty()) query += "&";
        query += param.name + "=" + url_encode(param.value);
    }

    if (!query.empty()) query += "&";
    query += "recvWindow=" + std::to_string(config_.recv_window_ms);
    query += "&timestamp=" + std::to_string(timestamp_ms);

    query += "&signature=" + generate_signature(query);
    return query;
}

std::string BinanceFuturesOMS::generate_signature(const std::string& data) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         config_.api_secret.data(), static_cast<int>(config_.api_secret.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &digest_len);

    std::string md_string;
    md_string.reserve(digest_len * 2);
    char hex[3];
    for (unsigned int i = 0; i < digest_len; i++) {
        std::snprintf(hex, sizeof(hex), "%02x", static_cast<unsigned int>(digest[i]));
        md_string += hex;
    }

    return md_string;
}

error_handling::Error BinanceFuturesOMS::parse_error(const HttpResponse& response) {
    if (response.status_code == 0) {
        std::string message = response.error_message.empty() ? "No response from exchange" : response.error_message;
        return error_handling::submission_error(message);
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream body_stream(response.body);

    if (Json::parseFromStream(builder, body_stream, &root, &errors) && root.isObject() && root.isMember("msg")) {
        int code = root.isMember("code") && root["code"].isInt() ? root["code"].asInt() : 0;
        return error_handling::submission_error(root["msg"].asString(), code, response.status_code);
    }

    std::string message = "HTTP " + std::to_string(response.status_code);
    if (!response.body.empty()) {
        message += ": " + response.body;
    }
    return error_handling::submission_error(message, 0, response.status_code);
}

std::string BinanceFuturesOMS::url_encode(const std::string& value) {
    static const char* hex_digits = "0123456789ABCDEF";

    std::string encoded;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex_digits[c >> 4];
            encoded += hex_digits[c & 0x0F];
        }
    }
    return encoded;
}

int64_t BinanceFuturesOMS::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace binance

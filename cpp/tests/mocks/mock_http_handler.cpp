#include "mock_http_handler.hpp"

HttpResponse MockHttpHandler::make_request(const HttpRequest& request) {
    requests_.push_back(request);

    // Simulate network failure
    if (network_failure_enabled_) {
        HttpResponse response;
        response.status_code = 0;
        response.error_message = network_failure_message_;
        response.success = false;
        return response;
    }

    if (responses_.empty()) {
        HttpResponse response;
        response.status_code = 404;
        response.body = R"({"code":-1,"msg":"Mock response not scripted"})";
        response.success = false;
        return response;
    }

    HttpResponse response = responses_.front();
    responses_.pop_front();
    return response;
}

void MockHttpHandler::enqueue_json(int status_code, const std::string& body) {
    HttpResponse response;
    response.status_code = status_code;
    response.body = body;
    response.headers["Content-Type"] = "application/json";
    response.success = (status_code >= 200 && status_code < 300);
    responses_.push_back(response);
}

void MockHttpHandler::enable_network_failure(bool enable, const std::string& message) {
    network_failure_enabled_ = enable;
    network_failure_message_ = message;
}

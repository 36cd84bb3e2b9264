#pragma once
#include "../../utils/http/i_http_handler.hpp"
#include <deque>
#include <string>
#include <vector>

// Scripted HTTP handler: replays queued responses and records every request
class MockHttpHandler : public IHttpHandler {
public:
    MockHttpHandler() = default;

    // IHttpHandler interface
    HttpResponse make_request(const HttpRequest& request) override;

    bool initialize() override { initialized_ = true; return true; }
    void shutdown() override { initialized_ = false; }
    bool is_initialized() const override { return initialized_; }

    void set_default_timeout(int timeout_ms) override { default_timeout_ms_ = timeout_ms; }

    // Test configuration
    void enqueue_json(int status_code, const std::string& body);
    void enable_network_failure(bool enable, const std::string& message = "CURL error: Couldn't connect to server");

    // Inspection
    int call_count() const { return static_cast<int>(requests_.size()); }
    const HttpRequest& last_request() const { return requests_.back(); }
    int default_timeout() const { return default_timeout_ms_; }

private:
    std::deque<HttpResponse> responses_;
    std::vector<HttpRequest> requests_;
    std::string network_failure_message_;
    int default_timeout_ms_{0};
    bool initialized_{false};
    bool network_failure_enabled_{false};
};

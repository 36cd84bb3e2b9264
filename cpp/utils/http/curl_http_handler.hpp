#pragma once
#include "i_http_handler.hpp"
#include <curl/curl.h>
#include <string>

// CURL-based HTTP handler implementation
class CurlHttpHandler : public IHttpHandler {
public:
    CurlHttpHandler();
    ~CurlHttpHandler() override;

    CurlHttpHandler(const CurlHttpHandler&) = delete;
    CurlHttpHandler& operator=(const CurlHttpHandler&) = delete;

    HttpResponse make_request(const HttpRequest& request) override;

    bool initialize() override;
    void shutdown() override;
    bool is_initialized() const override { return initialized_; }

    void set_default_timeout(int timeout_ms) override { default_timeout_ms_ = timeout_ms; }

private:
    struct WriteCallbackData {
        std::string* buffer;
        HttpResponse* response;
    };

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);
    static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);

    void setup_curl_options(const HttpRequest& request, WriteCallbackData& data);
    curl_slist* build_header_list(const HttpRequest& request) const;

    bool initialized_{false};
    int default_timeout_ms_{10000};

    CURL* curl_{nullptr};
};

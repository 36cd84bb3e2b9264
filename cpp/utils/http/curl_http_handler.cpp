#include "curl_http_handler.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace {
    // CURL global state management with reference counting
    std::mutex curl_init_mutex;
    std::atomic<int> curl_ref_count{0};

    void ensure_curl_initialized() {
        std::lock_guard<std::mutex> lock(curl_init_mutex);
        if (curl_ref_count.fetch_add(1) == 0) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    void ensure_curl_cleanup() {
        std::lock_guard<std::mutex> lock(curl_init_mutex);
        if (curl_ref_count.fetch_sub(1) == 1) {
            curl_global_cleanup();
        }
    }
}

std::unique_ptr<IHttpHandler> HttpHandlerFactory::create(HttpHandlerFactory::Type type) {
    switch (type) {
        case HttpHandlerFactory::Type::CURL:
            return std::make_unique<CurlHttpHandler>();
    }
    throw std::runtime_error("Unknown HTTP handler type");
}

CurlHttpHandler::CurlHttpHandler() {
    ensure_curl_initialized();
}

CurlHttpHandler::~CurlHttpHandler() {
    shutdown();
    ensure_curl_cleanup();
}

bool CurlHttpHandler::initialize() {
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return false;
        }
    }

    initialized_ = true;
    return true;
}

void CurlHttpHandler::shutdown() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    initialized_ = false;
}

HttpResponse CurlHttpHandler::make_request(const HttpRequest& request) {
    HttpResponse response;
    if (!initialized_) {
        response.error_message = "HTTP handler not initialized";
        return response;
    }

    WriteCallbackData data;
    data.buffer = &response.body;
    data.response = &response;

    // Reset CURL handle
    curl_easy_reset(curl_);

    setup_curl_options(request, data);

    curl_slist* header_list = build_header_list(request);
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);
    response.success = (response_code >= 200 && response_code < 300);

    return response;
}

void CurlHttpHandler::setup_curl_options(const HttpRequest& request, WriteCallbackData& data) {
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "futures_order_client/1.0");

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    int timeout = request.timeout_ms > 0 ? request.timeout_ms : default_timeout_ms_;
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout));

    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &data);

    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &data);
}

curl_slist* CurlHttpHandler::build_header_list(const HttpRequest& request) const {
    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    return header_list;
}

size_t CurlHttpHandler::WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->buffer) return 0;

    size_t total_size = size * nmemb;
    data->buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpHandler::HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->response) return 0;

    size_t total_size = size * nmemb;
    std::string header_line(static_cast<char*>(contents), total_size);

    // Remove trailing newline
    if (!header_line.empty() && header_line.back() == '\n') {
        header_line.pop_back();
    }
    if (!header_line.empty() && header_line.back() == '\r') {
        header_line.pop_back();
    }

    // Parse header (format: "Key: Value")
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        data->response->headers[key] = value;
    }

    return total_size;
}

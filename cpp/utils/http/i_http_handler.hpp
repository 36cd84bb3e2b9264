#pragma once
#include <map>
#include <memory>
#include <string>

// HTTP request structure
struct HttpRequest {
    std::string method;           // POST
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms{0};            // 0 means handler default
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};           // 0 when no response was received
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;    // transport failure description
    bool success{false};          // 2xx received
};

// Base interface for HTTP handlers
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    // Synchronous HTTP request; blocks for the round trip
    virtual HttpResponse make_request(const HttpRequest& request) = 0;

    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
};

// HTTP handler factory
class HttpHandlerFactory {
public:
    enum class Type {
        CURL
    };

    static std::unique_ptr<IHttpHandler> create(Type type = Type::CURL);
};

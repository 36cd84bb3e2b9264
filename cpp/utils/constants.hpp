#pragma once

/**
 * System-wide constants
 *
 * Centralized location for defaults, endpoint paths and exit codes
 * used throughout the order client.
 */

namespace constants {

// Process exit codes
namespace exit_code {
    constexpr int SUCCESS = 0;
    constexpr int CONFIGURATION_ERROR = 1;
    constexpr int VALIDATION_ERROR = 2;
    constexpr int SUBMISSION_ERROR = 3;
}

// Timeouts (in milliseconds unless otherwise specified)
namespace timeout {
    constexpr int DEFAULT_HTTP_MS = 10000;                // 10 seconds
}

// Exchange-specific defaults
namespace exchange {
    namespace binance {
        constexpr const char* NAME = "binance";
        constexpr const char* TESTNET_HTTP_URL = "https://testnet.binancefuture.com";
        constexpr const char* ORDER_ENDPOINT = "/fapi/v1/order";
        constexpr const char* API_KEY_HEADER = "X-MBX-APIKEY";
        constexpr const char* API_KEY_ENV = "BINANCE_API_KEY";
        constexpr const char* API_SECRET_ENV = "BINANCE_API_SECRET";
        constexpr int DEFAULT_RECV_WINDOW_MS = 5000;
    }
}

// Logging defaults
namespace logging {
    constexpr const char* DEFAULT_LOG_FILE = "bot.log";
    constexpr const char* DEFAULT_LOG_LEVEL = "INFO";
    constexpr const char* CLIENT_COMPONENT = "ORDER_CLIENT";
    constexpr const char* SUBMITTER_COMPONENT = "ORDER_SUBMITTER";
    constexpr const char* GATEWAY_COMPONENT = "BINANCE";
}

// Decimal rendering for order quantities and prices
namespace order {
    constexpr int MAX_FRACTION_DIGITS = 340;              // enough for the smallest normal double
}

} // namespace constants

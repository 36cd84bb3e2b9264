#pragma once
#include <string>
#include "../utils/config/process_config_manager.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/logger.hpp"

namespace order_client {

// Runtime settings; defaults apply when no config file is given
struct ClientSettings {
    std::string base_url{constants::exchange::binance::TESTNET_HTTP_URL};
    int recv_window_ms{constants::exchange::binance::DEFAULT_RECV_WINDOW_MS};
    int timeout_ms{constants::timeout::DEFAULT_HTTP_MS};
    std::string api_key_env{constants::exchange::binance::API_KEY_ENV};
    std::string api_secret_env{constants::exchange::binance::API_SECRET_ENV};

    std::string log_file{constants::logging::DEFAULT_LOG_FILE};
    logging::LogLevel log_level{logging::LogLevel::INFO};
};

/**
 * Read [binance] and [logging] sections. Keys that are absent keep their
 * defaults; malformed values are CONFIGURATION errors.
 */
error_handling::Result<ClientSettings> load_client_settings(const config::ProcessConfigManager& manager);

// Load the file then read it; unreadable or malformed files are CONFIGURATION errors
error_handling::Result<ClientSettings> load_client_settings(const std::string& config_file);

} // namespace order_client

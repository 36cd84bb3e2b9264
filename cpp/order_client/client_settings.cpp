#include "client_settings.hpp"
#include <stdexcept>

namespace order_client {

namespace {

using SettingsResult = error_handling::Result<ClientSettings>;

SettingsResult invalid(const std::string& section, const std::string& key, const std::string& value) {
    return SettingsResult::error(error_handling::configuration_error(
        "Invalid value for [" + section + "] " + key + ": " + value));
}

} // namespace

error_handling::Result<ClientSettings> load_client_settings(const config::ProcessConfigManager& manager) {
    ClientSettings settings;

    settings.base_url = manager.get_string("binance", "base_url", settings.base_url);
    while (!settings.base_url.empty() && settings.base_url.back() == '/') {
        settings.base_url.pop_back();
    }
    if (settings.base_url.empty()) {
        return invalid("binance", "base_url", "<empty>");
    }

    settings.api_key_env = manager.get_string("binance", "api_key_env", settings.api_key_env);
    settings.api_secret_env = manager.get_string("binance", "api_secret_env", settings.api_secret_env);

    try {
        settings.recv_window_ms = manager.get_int("binance", "recv_window_ms", settings.recv_window_ms);
    } catch (const std::exception&) {
        return invalid("binance", "recv_window_ms", manager.get_string("binance", "recv_window_ms"));
    }
    if (settings.recv_window_ms <= 0) {
        return invalid("binance", "recv_window_ms", std::to_string(settings.recv_window_ms));
    }

    try {
        settings.timeout_ms = manager.get_int("binance", "timeout_ms", settings.timeout_ms);
    } catch (const std::exception&) {
        return invalid("binance", "timeout_ms", manager.get_string("binance", "timeout_ms"));
    }
    if (settings.timeout_ms <= 0) {
        return invalid("binance", "timeout_ms", std::to_string(settings.timeout_ms));
    }

    settings.log_file = manager.get_string("logging", "log_file", settings.log_file);

    const std::string level_name = manager.get_string("logging", "log_level", constants::logging::DEFAULT_LOG_LEVEL);
    auto level = logging::parse_level(level_name);
    if (!level) {
        return invalid("logging", "log_level", level_name);
    }
    settings.log_level = *level;

    return SettingsResult::success(settings);
}

error_handling::Result<ClientSettings> load_client_settings(const std::string& config_file) {
    config::ProcessConfigManager manager;
    if (!manager.load_config(config_file)) {
        std::string message = "Failed to load configuration from " + config_file;
        const auto& errors = manager.get_validation_errors();
        if (!errors.empty()) {
            message += ": " + errors.front();
        }
        return SettingsResult::error(error_handling::configuration_error(message));
    }

    return load_client_settings(manager);
}

} // namespace order_client

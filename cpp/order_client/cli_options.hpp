#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../utils/error_handling.hpp"
#include "../utils/oms/order.hpp"

namespace order_client {

struct CliOptions {
    std::optional<std::string> api_key;
    std::optional<std::string> api_secret;
    std::optional<std::string> config_file;

    std::string symbol;
    std::string side;
    std::string order_type;
    double quantity{0.0};
    std::optional<double> price;
    std::string time_in_force{"GTC"};

    bool show_help{false};

    oms::OrderIntent to_intent() const;
};

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

// Environment variable lookup; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

/**
 * Parse command line arguments (program name excluded).
 *
 * Accepts "--flag value" and "--flag=value". Choices for --side, --type and
 * --tif are case-sensitive. --quantity and --price must be finite numbers
 * greater than zero. When --help is present the remaining checks are
 * skipped and show_help is set.
 *
 * @return options, or a VALIDATION error describing the first problem
 */
error_handling::Result<CliOptions> parse_cli(const std::vector<std::string>& args);

std::string usage_text(const std::string& program_name);

// Flag value wins; otherwise the environment. Empty counts as missing.
error_handling::Result<Credentials> resolve_credentials(const CliOptions& options, const EnvLookup& env,
                                                        const std::string& api_key_env,
                                                        const std::string& api_secret_env);

} // namespace order_client

#include "cli_options.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <sstream>

namespace order_client {

namespace {

using CliResult = error_handling::Result<CliOptions>;

CliResult fail(const std::string& message) {
    return CliResult::error(error_handling::validation_error(message));
}

bool parse_positive_number(const std::string& text, double& out) {
    if (text.empty()) return false;

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size()) return false;
    if (!std::isfinite(value)) return false;

    out = value;
    return true;
}

// "-x..." is a flag, not a value, unless it reads as a negative number
bool looks_like_flag(const std::string& text) {
    if (text.size() < 2 || text[0] != '-') return false;
    char* end = nullptr;
    std::strtod(text.c_str(), &end);
    return end != text.c_str() + text.size();
}

bool is_choice(const std::string& value, const std::vector<std::string>& choices) {
    return std::find(choices.begin(), choices.end(), value) != choices.end();
}

std::string join_choices(const std::vector<std::string>& choices) {
    std::string joined;
    for (const auto& choice : choices) {
        if (!joined.empty()) joined += ", ";
        joined += "'" + choice + "'";
    }
    return joined;
}

const std::vector<std::string> kSideChoices{"BUY", "SELL"};
const std::vector<std::string> kTypeChoices{"MARKET", "LIMIT"};
const std::vector<std::string> kTifChoices{"GTC", "IOC", "FOK"};

const std::vector<std::string> kKnownFlags{
    "--api-key", "--api-secret", "--config", "--symbol", "--side",
    "--type", "--quantity", "--price", "--tif"};

} // namespace

oms::OrderIntent CliOptions::to_intent() const {
    oms::OrderIntent intent;
    intent.symbol = symbol;
    intent.side = side;
    intent.order_type = order_type;
    intent.quantity = quantity;
    intent.price = price;
    intent.time_in_force = time_in_force;
    return intent;
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

error_handling::Result<CliOptions> parse_cli(const std::vector<std::string>& args) {
    // Last occurrence of a flag wins
    std::map<std::string, std::string> values;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            CliOptions options;
            options.show_help = true;
            return CliResult::success(options);
        }

        std::string flag = arg;
        std::string value;
        bool has_inline_value = false;

        size_t eq_pos = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
            flag = arg.substr(0, eq_pos);
            value = arg.substr(eq_pos + 1);
            has_inline_value = true;
        }

        if (!is_choice(flag, kKnownFlags)) {
            return fail("unrecognized arguments: " + arg);
        }

        if (!has_inline_value) {
            if (i + 1 >= args.size() || looks_like_flag(args[i + 1])) {
                return fail("argument " + flag + ": expected one argument");
            }
            value = args[++i];
        }

        values[flag] = value;
    }

    CliOptions options;

    std::vector<std::string> missing;
    for (const char* required : {"--symbol", "--side", "--type", "--quantity"}) {
        if (values.find(required) == values.end()) {
            missing.push_back(required);
        }
    }
    if (!missing.empty()) {
        std::string joined;
        for (const auto& flag : missing) {
            if (!joined.empty()) joined += ", ";
            joined += flag;
        }
        return fail("the following arguments are required: " + joined);
    }

    if (values.count("--api-key")) options.api_key = values["--api-key"];
    if (values.count("--api-secret")) options.api_secret = values["--api-secret"];
    if (values.count("--config")) options.config_file = values["--config"];

    options.symbol = values["--symbol"];

    options.side = values["--side"];
    if (!is_choice(options.side, kSideChoices)) {
        return fail("argument --side: invalid choice: '" + options.side + "' (choose from " + join_choices(kSideChoices) + ")");
    }

    options.order_type = values["--type"];
    if (!is_choice(options.order_type, kTypeChoices)) {
        return fail("argument --type: invalid choice: '" + options.order_type + "' (choose from " + join_choices(kTypeChoices) + ")");
    }

    double quantity = 0.0;
    if (!parse_positive_number(values["--quantity"], quantity)) {
        return fail("argument --quantity: could not convert string to number: '" + values["--quantity"] + "'");
    }
    if (quantity <= 0.0) {
        return fail("argument --quantity: Value must be positive.");
    }
    options.quantity = quantity;

    if (values.count("--price")) {
        double price = 0.0;
        if (!parse_positive_number(values["--price"], price)) {
            return fail("argument --price: could not convert string to number: '" + values["--price"] + "'");
        }
        if (price <= 0.0) {
            return fail("argument --price: Value must be positive.");
        }
        options.price = price;
    }

    if (values.count("--tif")) {
        options.time_in_force = values["--tif"];
        if (!is_choice(options.time_in_force, kTifChoices)) {
            return fail("argument --tif: invalid choice: '" + options.time_in_force + "' (choose from " + join_choices(kTifChoices) + ")");
        }
    }

    return CliResult::success(options);
}

std::string usage_text(const std::string& program_name) {
    std::ostringstream out;
    out << "usage: " << program_name
        << " [--api-key API_KEY] [--api-secret API_SECRET] [--config FILE]\n"
        << "       --symbol SYMBOL --side {BUY,SELL} --type {MARKET,LIMIT}\n"
        << "       --quantity QUANTITY [--price PRICE] [--tif {GTC,IOC,FOK}]\n"
        << "\n"
        << "Binance Futures Testnet order client\n"
        << "\n"
        << "options:\n"
        << "  --api-key API_KEY        Binance API key (default: $BINANCE_API_KEY)\n"
        << "  --api-secret API_SECRET  Binance API secret (default: $BINANCE_API_SECRET)\n"
        << "  --config FILE            INI configuration file\n"
        << "  --symbol SYMBOL          Trading pair symbol, e.g. BTCUSDT\n"
        << "  --side {BUY,SELL}        Order side\n"
        << "  --type {MARKET,LIMIT}    Order type\n"
        << "  --quantity QUANTITY      Order quantity\n"
        << "  --price PRICE            Price (required for LIMIT)\n"
        << "  --tif {GTC,IOC,FOK}      Time in force for LIMIT orders (default: GTC)\n"
        << "  -h, --help               Show this help message and exit\n";
    return out.str();
}

error_handling::Result<Credentials> resolve_credentials(const CliOptions& options, const EnvLookup& env,
                                                        const std::string& api_key_env,
                                                        const std::string& api_secret_env) {
    auto pick = [&env](const std::optional<std::string>& flag_value, const std::string& env_name) {
        if (flag_value && !flag_value->empty()) {
            return *flag_value;
        }
        if (env) {
            auto from_env = env(env_name);
            if (from_env) return *from_env;
        }
        return std::string();
    };

    Credentials credentials;
    credentials.api_key = pick(options.api_key, api_key_env);
    credentials.api_secret = pick(options.api_secret, api_secret_env);

    if (credentials.api_key.empty() || credentials.api_secret.empty()) {
        return error_handling::Result<Credentials>::error(error_handling::configuration_error(
            "API credentials must be provided via flags or environment variables."));
    }

    return error_handling::Result<Credentials>::success(credentials);
}

} // namespace order_client

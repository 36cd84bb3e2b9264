#include "order_client_lib.hpp"
#include "json_text.hpp"
#include "order_submitter.hpp"
#include "../exchanges/binance/http/binance_futures_oms.hpp"
#include "../utils/constants.hpp"
#include "../utils/oms/order_builder.hpp"
#include <json/json.h>

namespace order_client {

OrderClientApp::OrderClientApp() : OrderClientApp(Dependencies{}) {
}

OrderClientApp::OrderClientApp(Dependencies dependencies) : deps_(std::move(dependencies)) {
    if (!deps_.env) {
        deps_.env = process_env();
    }
    if (!deps_.http_handler_provider) {
        deps_.http_handler_provider = []() -> std::shared_ptr<IHttpHandler> {
            return HttpHandlerFactory::create(HttpHandlerFactory::Type::CURL);
        };
    }
    if (!deps_.out) deps_.out = &std::cout;
    if (!deps_.err) deps_.err = &std::cerr;
}

int OrderClientApp::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    const std::string program_name = argc > 0 ? argv[0] : "futures_order_client";
    return run(args, program_name);
}

int OrderClientApp::run(const std::vector<std::string>& args, const std::string& program_name) {
    std::ostream& out = *deps_.out;
    std::ostream& err = *deps_.err;

    // Command line
    auto cli = parse_cli(args);
    if (cli.is_error()) {
        err << usage_text(program_name) << program_name << ": error: " << cli.error().message << std::endl;
        return error_handling::exit_code_for(cli.error().kind);
    }
    const CliOptions& options = cli.value();
    if (options.show_help) {
        out << usage_text(program_name);
        return constants::exit_code::SUCCESS;
    }

    // Configuration
    auto settings_result = options.config_file
        ? load_client_settings(*options.config_file)
        : error_handling::Result<ClientSettings>::success(ClientSettings{});
    if (settings_result.is_error()) {
        logging::Logger logger(acquire_log_manager(ClientSettings{}), constants::logging::CLIENT_COMPONENT);
        logger.error(settings_result.error().message);
        return error_handling::exit_code_for(settings_result.error().kind);
    }
    const ClientSettings& settings = settings_result.value();

    auto log_manager = acquire_log_manager(settings);
    logging::Logger logger(log_manager, constants::logging::CLIENT_COMPONENT);

    // Credentials gate: nothing order-related happens without them
    auto credentials = resolve_credentials(options, deps_.env, settings.api_key_env, settings.api_secret_env);
    if (credentials.is_error()) {
        logger.error(credentials.error().message);
        return error_handling::exit_code_for(credentials.error().kind);
    }

    std::shared_ptr<IHttpHandler> http_handler = deps_.http_handler_provider();
    if (!http_handler) {
        logger.error("No HTTP handler available");
        return constants::exit_code::SUBMISSION_ERROR;
    }
    http_handler->set_default_timeout(settings.timeout_ms);

    binance::BinanceConfig binance_config;
    binance_config.api_key = credentials.value().api_key;
    binance_config.api_secret = credentials.value().api_secret;
    binance_config.base_url = settings.base_url;
    binance_config.recv_window_ms = settings.recv_window_ms;
    binance_config.timeout_ms = settings.timeout_ms;

    binance::BinanceFuturesOMS oms(binance_config, http_handler,
                                   logging::Logger(log_manager, constants::logging::GATEWAY_COMPONENT));
    logger.info("Client initialized for Binance Futures testnet @ " + oms.base_url());

    // Validation
    auto request = oms::build_order_request(options.to_intent());
    if (request.is_error()) {
        logger.error(request.error().message);
        return error_handling::exit_code_for(request.error().kind);
    }

    // Submission
    OrderSubmitter submitter(oms, logging::Logger(log_manager, constants::logging::SUBMITTER_COMPONENT));
    auto outcome = submitter.submit(request.value());
    if (outcome.is_error()) {
        return error_handling::exit_code_for(outcome.error().kind);
    }

    const OrderOutcome& response = outcome.value();
    const Json::Value order_id = response.document.get("orderId", Json::Value());
    std::string order_id_text = "None";
    if (!order_id.isNull()) {
        order_id_text = order_id.isConvertibleTo(Json::stringValue) ? order_id.asString()
                                                                     : OrderSubmitter::to_compact_json(order_id);
    }
    logger.info("Order successfully executed. ID: " + order_id_text);

    // Exchange text as received, re-indented only
    out << format_json_text(response.body, 2) << std::endl;

    return constants::exit_code::SUCCESS;
}

std::shared_ptr<logging::LogManager> OrderClientApp::acquire_log_manager(const ClientSettings& settings) {
    if (deps_.log_manager) {
        return deps_.log_manager;
    }
    deps_.log_manager = logging::initialize_logging(settings.log_file, settings.log_level, *deps_.err);
    return deps_.log_manager;
}

} // namespace order_client

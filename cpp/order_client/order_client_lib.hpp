#pragma once
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "cli_options.hpp"
#include "client_settings.hpp"
#include "../utils/http/i_http_handler.hpp"
#include "../utils/logging/logger.hpp"

namespace order_client {

/**
 * Order Client Library
 *
 * One invocation places at most one order:
 *   CLI -> config -> logging -> credentials -> gateway -> builder -> submitter
 *
 * Every stage that fails ends the run with its own exit code
 * (see constants::exit_code). On success the exchange response is written
 * to the output stream as indented JSON; log lines never go there.
 */
class OrderClientApp {
public:
    using HttpHandlerProvider = std::function<std::shared_ptr<IHttpHandler>()>;

    struct Dependencies {
        EnvLookup env;                                 // default: process environment
        HttpHandlerProvider http_handler_provider;     // default: CURL handler
        std::shared_ptr<logging::LogManager> log_manager; // default: initialize_logging()
        std::ostream* out{&std::cout};
        std::ostream* err{&std::cerr};
    };

    OrderClientApp();
    explicit OrderClientApp(Dependencies dependencies);

    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args, const std::string& program_name = "futures_order_client");

private:
    Dependencies deps_;

    std::shared_ptr<logging::LogManager> acquire_log_manager(const ClientSettings& settings);
};

} // namespace order_client

#include "engine/cli_config.h"
#include "core/auth/credentials_resolver.h"
#include "core/backoff/backoff_strategy.h"
#include "core/net/ws_transport.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace tradecast {

namespace {

std::vector<std::string> split_symbols(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(' ');
        const auto last = item.find_last_not_of(' ');
        if (first != std::string::npos) {
            out.push_back(item.substr(first, last - first + 1));
        }
    }
    return out;
}

bool is_known_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "warning" || level == "error" || level == "err" || level == "critical" ||
           level == "off";
}

} // namespace

service::ConnectionManagerSettings RelayConfig::connection_settings() const {
    service::ConnectionManagerSettings settings;
    settings.initial_delay = initial_backoff;
    settings.max_delay = max_backoff;
    settings.multiplier = backoff_multiplier;
    return settings;
}

connector::BlockchainClientOptions RelayConfig::client_options() const {
    connector::BlockchainClientOptions options;
    options.url = ws_url;
    options.api_token = api_token;
    return options;
}

std::vector<market::Symbol> RelayConfig::parsed_symbols() const {
    std::vector<market::Symbol> out;
    for (const auto& s : symbols) {
        auto symbol = market::parse_symbol(s);
        if (!symbol) {
            throw std::invalid_argument("unknown symbol '" + s + "'");
        }
        out.push_back(*symbol);
    }
    return out;
}

namespace cli {

RelayConfig parse_command_line_args(int argc, char* argv[]) {
    args::ArgumentParser parser("Tradecast Relay",
                                "Relays exchange trades to ZeroMQ subscribers and serves recent trades over JSON-RPC.");

    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> ws_url(parser, "url", "Upstream WebSocket URL (env TRADECAST_WS_URL)",
                                        {"ws-url"});
    args::ValueFlag<std::string> api_token(parser, "token", "Upstream API token (env TRADECAST_API_TOKEN)",
                                           {"api-token"});
    args::ValueFlag<std::string> symbols(parser, "list", "Comma separated symbols to subscribe at startup (e.g. BTC-USD,ETH-USD)",
                                         {"symbols"});
    args::ValueFlag<int> initial_backoff(parser, "ms", "Initial reconnect delay in milliseconds (default 5000)",
                                         {"initial-backoff-ms"});
    args::ValueFlag<int> max_backoff(parser, "ms", "Maximum reconnect delay in milliseconds (default 300000)",
                                     {"max-backoff-ms"});
    args::ValueFlag<double> multiplier(parser, "factor", "Reconnect delay multiplier (default 2.0)",
                                       {"backoff-multiplier"});
    args::ValueFlag<std::string> pub_endpoint(parser, "endpoint", "ZMQ PUB endpoint for trade notifications (default tcp://*:5556)",
                                              {"pub-endpoint"});
    args::ValueFlag<std::string> rep_endpoint(parser, "endpoint", "ZMQ REP endpoint for JSON-RPC requests (default tcp://*:5555)",
                                              {"rep-endpoint"});
    args::ValueFlag<std::string> log_level(parser, "level", "trace|debug|info|warn|error|critical|off (default info)",
                                           {"log-level"});

    RelayConfig config;

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Completion& e) {
        std::cout << e.what();
        std::exit(0);
    } catch (const args::Help&) {
        std::cout << parser;
        std::cout << "\nExamples:\n";
        std::cout << "  # Relay BTC and ETH trades with defaults\n";
        std::cout << "  " << argv[0] << " --symbols BTC-USD,ETH-USD\n\n";
        std::cout << "  # Authenticated feed, custom endpoints\n";
        std::cout << "  " << argv[0] << " --api-token TOKEN --pub-endpoint tcp://*:7001 --rep-endpoint tcp://*:7000\n\n";
        std::exit(0);
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(1);
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(1);
    }

    // Extract values
    if (symbols) config.symbols = split_symbols(args::get(symbols));
    if (initial_backoff) config.initial_backoff = std::chrono::milliseconds(args::get(initial_backoff));
    if (max_backoff) config.max_backoff = std::chrono::milliseconds(args::get(max_backoff));
    if (multiplier) config.backoff_multiplier = args::get(multiplier);
    if (pub_endpoint) config.publish_endpoint = args::get(pub_endpoint);
    if (rep_endpoint) config.request_endpoint = args::get(rep_endpoint);
    if (log_level) config.log_level = args::get(log_level);

    // Upstream endpoint and token resolution (env allowed) using centralized resolver
    auto upstream = auth::resolve_upstream(ws_url ? args::get(ws_url) : std::string{},
                                           api_token ? args::get(api_token) : std::string{},
                                           config.ws_url);
    config.ws_url = upstream.ws_url;
    config.api_token = upstream.api_token;

    return config;
}

std::vector<std::string> config_errors(const RelayConfig& config) {
    std::vector<std::string> errors;

    try {
        netws::parse_ws_url(config.ws_url);
    } catch (const std::invalid_argument& e) {
        errors.push_back(std::string("--ws-url: ") + e.what());
    }

    try {
        config.connection_settings().to_backoff_options().validate();
    } catch (const std::invalid_argument& e) {
        errors.push_back(std::string("backoff: ") + e.what());
    }

    for (const auto& s : config.symbols) {
        if (!market::parse_symbol(s)) {
            errors.push_back("Unsupported symbol '" + s + "'. Supported: BTC-USD, ETH-USD, SOL-USD");
        }
    }

    if (config.publish_endpoint.empty()) {
        errors.push_back("--pub-endpoint must not be empty");
    }
    if (config.request_endpoint.empty()) {
        errors.push_back("--rep-endpoint must not be empty");
    }
    if (!config.publish_endpoint.empty() && config.publish_endpoint == config.request_endpoint) {
        errors.push_back("--pub-endpoint and --rep-endpoint must differ");
    }

    if (!is_known_level(config.log_level)) {
        errors.push_back("Unknown log level '" + config.log_level + "'");
    }

    return errors;
}

bool validate_config(const RelayConfig& config) {
    const auto errors = config_errors(config);
    if (!errors.empty()) {
        std::cerr << "Configuration errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

bool initialize_logging(const std::string& level) {
    // Create logs directory if it doesn't exist
    try {
        std::filesystem::create_directories("logs");
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to create logs directory: " << ex.what() << std::endl;
        return false;
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/tradecast.log", 1024*1024*5, 3);
        file_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("tradecast", sinks.begin(), sinks.end());

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [PID:%P] [TID:%t] [%^%l%$] [%s:%#] [%!] %v");
        logger->set_level(spdlog::level::from_str(level));

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace cli
} // namespace tradecast

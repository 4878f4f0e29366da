#pragma once

#include "connector/blockchain_trade_client.h"
#include "market/trade.h"
#include "service/connection_manager.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tradecast {

/**
 * @struct RelayConfig
 * @brief Runtime configuration of the relay process
 */
struct RelayConfig {
    std::string ws_url = "wss://ws.blockchain.info/mercury-gateway/v1/ws";
    std::optional<std::string> api_token;
    std::chrono::milliseconds initial_backoff{std::chrono::seconds(5)};
    std::chrono::milliseconds max_backoff{std::chrono::seconds(300)};
    double backoff_multiplier = 2.0;
    std::string publish_endpoint = "tcp://*:5556";
    std::string request_endpoint = "tcp://*:5555";
    std::vector<std::string> symbols;       ///< Subscribed at startup, wire form ("BTC-USD")
    std::string log_level = "info";

    service::ConnectionManagerSettings connection_settings() const;
    connector::BlockchainClientOptions client_options() const;

    /// @throws std::invalid_argument for an unknown symbol (validate_config() reports it first)
    std::vector<market::Symbol> parsed_symbols() const;
};

namespace cli {

/**
 * @brief Parse command line arguments
 *
 * Empty --ws-url / --api-token fall back to TRADECAST_WS_URL / TRADECAST_API_TOKEN.
 * Prints usage and exits on --help or a parse error.
 */
RelayConfig parse_command_line_args(int argc, char* argv[]);

/**
 * @brief Human readable configuration problems, empty when the config is usable
 */
std::vector<std::string> config_errors(const RelayConfig& config);

/**
 * @brief Validate configuration, printing every problem to stderr
 * @return true if valid, false otherwise
 */
bool validate_config(const RelayConfig& config);

/**
 * @brief Initialize logging system (console + rotating file under logs/)
 * @param level spdlog level name ("trace", "debug", "info", ...)
 * @return true if successful, false otherwise
 */
bool initialize_logging(const std::string& level);

} // namespace cli
} // namespace tradecast

/**
 * @file main.cpp
 * @brief Entry point of the trade relay
 *
 * Composition root: builds the upstream client, reconnect manager, subscription refcounts and
 * trade cache, hands them to TradeDataService, and exposes the service through a ZMQ PUB
 * channel (trade / connection notifications) and a ZMQ REP JSON-RPC gateway.
 *
 * Shutdown (SIGINT, SIGTERM): stop the gateway, stop the service (cancels any connect or
 * backoff in flight), then join the startup thread.
 */

#include "cache/trade_cache.h"
#include "connector/blockchain_trade_client.h"
#include "connector/zmq_trade_publisher.h"
#include "core/errors.h"
#include "core/net/beast_ws_transport.h"
#include "engine/cli_config.h"
#include "gateway/request_dispatcher.h"
#include "gateway/request_server.h"
#include "service/connection_manager.h"
#include "service/subscription_manager.h"
#include "service/trade_data_service.h"

#include <spdlog/spdlog.h>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

/**
 * @brief Signal handler for graceful shutdown; only flips a lock-free flag
 */
void signal_handler(int) {
    g_shutdown_requested.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace tradecast;

    RelayConfig config;
    try {
        config = cli::parse_command_line_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing command line arguments: " << e.what() << std::endl;
        return 1;
    }

    if (!cli::validate_config(config)) {
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    }

    if (!cli::initialize_logging(config.log_level)) {
        std::cerr << "Failed to initialize logging system" << std::endl;
        return 1;
    }

    spdlog::info("=== Tradecast Relay ===");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        spdlog::info("[Main] Configuration Summary:");
        spdlog::info("[Main]   Upstream: {}", config.ws_url);
        spdlog::info("[Main]   API token: {}", config.api_token ? "set" : "none");
        spdlog::info("[Main]   Backoff: {} ms initial, {} ms max, x{}",
                     config.initial_backoff.count(), config.max_backoff.count(), config.backoff_multiplier);
        spdlog::info("[Main]   Publishing on {}", config.publish_endpoint);
        spdlog::info("[Main]   JSON-RPC on {}", config.request_endpoint);

        auto zmq_context = std::make_shared<zmq::context_t>(1);
        ZmqTradePublisher publisher(zmq_context, config.publish_endpoint);

        auto client = std::make_shared<connector::BlockchainTradeClient>(
            config.client_options(), std::make_shared<netws::BeastWsTransport>());

        service::TradeDataService data_service(
            client,
            std::make_unique<service::ConnectionManager>(client, config.connection_settings()),
            std::make_unique<service::SubscriptionManager>(),
            std::make_unique<cache::TradeCache>());

        data_service.trade_received.add([&publisher](const market::Trade& trade) {
            publisher.publish_trade(trade);
        });
        data_service.connection_lost.add([&publisher]() { publisher.publish_connection_lost(); });
        data_service.connection_restored.add([&publisher]() { publisher.publish_connection_restored(); });

        gateway::RequestDispatcher dispatcher(data_service);
        gateway::RequestServer request_server(zmq_context, config.request_endpoint, dispatcher);
        request_server.start();

        const auto initial_symbols = config.parsed_symbols();
        std::atomic<bool> starter_done{false};
        std::thread starter([&data_service, &initial_symbols, &starter_done]() {
            try {
                data_service.start();
                if (data_service.is_connected()) {
                    for (market::Symbol symbol : initial_symbols) {
                        try {
                            data_service.subscribe_to_trades(symbol);
                        } catch (const ConnectionError& e) {
                            spdlog::warn("[Main] initial subscribe to {} failed: {}",
                                         market::to_string(symbol), e.what());
                        }
                    }
                }
            } catch (const std::exception& e) {
                spdlog::error("[Main] startup failed: {}", e.what());
                g_shutdown_requested.store(true);
            }
            starter_done.store(true);
        });

        spdlog::info("[Main] Relay started, press Ctrl+C to stop");

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("[Main] Shutdown requested");
        request_server.stop();
        data_service.stop();
        // A start() that had not yet registered when stop() ran needs another stop.
        while (!starter_done.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            data_service.stop();
        }
        starter.join();

        spdlog::info("[Main] Relay stopped (published drops: {})", publisher.dropped());

    } catch (const std::exception& e) {
        spdlog::error("[Main] Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}

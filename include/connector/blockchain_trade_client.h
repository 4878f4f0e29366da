/**
 * @file blockchain_trade_client.h
 * @brief TradeFeedClient for the Blockchain.com exchange "trades" channel
 *
 * A dedicated receive thread reads frames, decodes them and fires the TradeFeedClient events.
 * An unintended drop fires connection_lost once; the next successful connect() fires
 * connection_restored. Reconnecting is left to the owner (ConnectionManager).
 */

#pragma once

#include "connector/trade_feed_client.h"
#include "core/net/ws_transport.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tradecast::connector {

/**
 * @struct BlockchainClientOptions
 * @brief Upstream endpoint and credentials
 */
struct BlockchainClientOptions {
    std::string url = "wss://ws.blockchain.info/mercury-gateway/v1/ws";
    std::optional<std::string> api_token;   ///< Sent with every (un)subscribe when set
};

class BlockchainTradeClient : public TradeFeedClient {
public:
    BlockchainTradeClient(BlockchainClientOptions options, std::shared_ptr<netws::WsTransport> transport);
    ~BlockchainTradeClient() override;

    BlockchainTradeClient(const BlockchainTradeClient&) = delete;
    BlockchainTradeClient& operator=(const BlockchainTradeClient&) = delete;

    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }
    void connect(const sync::CancellationToken& token) override;
    void disconnect(const sync::CancellationToken& token) override;

    void subscribe_to_trades(market::Symbol symbol, const sync::CancellationToken& token) override;
    void unsubscribe_from_trades(market::Symbol symbol, const sync::CancellationToken& token) override;

    /// Frames rejected by the codec since construction
    uint64_t decode_errors() const { return decode_errors_.load(); }

private:
    void receive_loop();
    void handle_frame(const std::string& frame);
    void send(const std::string& payload, const sync::CancellationToken& token);
    void join_receive_thread();

    BlockchainClientOptions options_;
    std::shared_ptr<netws::WsTransport> transport_;

    std::mutex lifecycle_mutex_;
    std::thread receive_thread_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> disconnecting_{false};
    std::atomic<bool> lost_{false};
    std::atomic<uint64_t> decode_errors_{0};
};

} // namespace tradecast::connector

#pragma once

#include "market/trade.h"

#include <zmq.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace tradecast {

/**
 * @brief Fans trade and connection-state notifications out on a ZMQ PUB socket
 *
 * Messages are two frames: topic, then a JSON-RPC 2.0 notification body.
 *   trades.BTC-USD             {"jsonrpc":"2.0","method":"trades.update","params":{...trade...}}
 *   status.connection_lost     {"jsonrpc":"2.0","method":"status.connection_lost","params":{...}}
 *   status.connection_restored {"jsonrpc":"2.0","method":"status.connection_restored","params":{...}}
 *
 * Publishing never blocks: a slow subscriber loses messages past the high-water mark.
 */
class ZmqTradePublisher {
public:
    /**
     * @brief Construct ZMQ publisher
     * @param context Shared ZMQ context
     * @param endpoint ZMQ endpoint (e.g., "tcp://*:5556" or "ipc:///tmp/trades.ipc")
     * @param send_hwm Outbound high-water mark per subscriber
     */
    ZmqTradePublisher(
        std::shared_ptr<zmq::context_t> context,
        const std::string& endpoint,
        int send_hwm = 10000
    );

    void publish_trade(const market::Trade& trade);
    void publish_connection_lost();
    void publish_connection_restored();

    std::string get_endpoint() const {
        return endpoint_;
    }

    /// Messages that could not be queued (high-water mark reached or socket error)
    uint64_t dropped() const { return dropped_.load(); }

    static std::string trade_topic(market::Symbol symbol);

private:
    void publish_event(const std::string& topic, const nlohmann::json& body);

    std::shared_ptr<zmq::context_t> context_;
    std::string endpoint_;
    std::mutex socket_mutex_;
    zmq::socket_t publisher_;
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace tradecast

/**
 * @file zmq_trade_publisher.cpp
 * @brief Implementation of ZmqTradePublisher
 */

#include "connector/zmq_trade_publisher.h"
#include "connector/trade_message_codec.h"

#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace tradecast {

namespace {

nlohmann::json notification(const std::string& method, nlohmann::json params) {
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", std::move(params)}
    };
}

nlohmann::json status_params(const char* state) {
    const auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    return nlohmann::json{
        {"state", state},
        {"timestamp", market::format_timestamp(now)}
    };
}

zmq::context_t& require_context(const std::shared_ptr<zmq::context_t>& context) {
    if (!context) {
        throw std::invalid_argument("ZMQ context cannot be null");
    }
    return *context;
}

}  // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ZmqTradePublisher::ZmqTradePublisher(
    std::shared_ptr<zmq::context_t> context,
    const std::string& endpoint,
    int send_hwm
)   : context_(context),
      endpoint_(endpoint),
      publisher_(require_context(context_), zmq::socket_type::pub) {
    try {
        publisher_.set(zmq::sockopt::sndhwm, send_hwm);
        publisher_.set(zmq::sockopt::linger, 0);
        publisher_.bind(endpoint_);
        spdlog::info("[ZmqTradePublisher] bound to {}", endpoint_);
    } catch (const zmq::error_t& e) {
        spdlog::error("[ZmqTradePublisher] failed to bind to {}: {}", endpoint_, e.what());
        throw;
    }
}

// ============================================================================
// PUBLIC METHODS
// ============================================================================

std::string ZmqTradePublisher::trade_topic(market::Symbol symbol) {
    return "trades." + market::to_string(symbol);
}

void ZmqTradePublisher::publish_trade(const market::Trade& trade) {
    publish_event(trade_topic(trade.symbol()),
                  notification("trades.update", connector::TradeMessageCodec::trade_to_json(trade)));
}

void ZmqTradePublisher::publish_connection_lost() {
    publish_event("status.connection_lost",
                  notification("status.connection_lost", status_params("connection_lost")));
}

void ZmqTradePublisher::publish_connection_restored() {
    publish_event("status.connection_restored",
                  notification("status.connection_restored", status_params("connection_restored")));
}

// ============================================================================
// PRIVATE METHODS
// ============================================================================

void ZmqTradePublisher::publish_event(const std::string& topic, const nlohmann::json& body) {
    const std::string message_str = body.dump();
    try {
        std::lock_guard<std::mutex> lk(socket_mutex_);

        zmq::message_t topic_msg(topic.data(), topic.size());
        auto sent = publisher_.send(topic_msg, zmq::send_flags::sndmore | zmq::send_flags::dontwait);
        if (!sent) {
            dropped_.fetch_add(1);
            spdlog::debug("[ZmqTradePublisher] dropped topic={} (would block)", topic);
            return;
        }

        zmq::message_t body_msg(message_str.data(), message_str.size());
        if (!publisher_.send(body_msg, zmq::send_flags::dontwait)) {
            dropped_.fetch_add(1);
            spdlog::warn("[ZmqTradePublisher] body frame for {} not queued", topic);
            return;
        }

        spdlog::debug("[ZmqTradePublisher] published topic={}, size={}", topic, message_str.size());
    } catch (const zmq::error_t& e) {
        dropped_.fetch_add(1);
        spdlog::error("[ZmqTradePublisher] publish error on {}: {}", topic, e.what());
    }
}

}  // namespace tradecast

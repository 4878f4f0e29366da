/**
 * @file blockchain_trade_client.cpp
 */

#include "connector/blockchain_trade_client.h"
#include "connector/trade_message_codec.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tradecast::connector {

BlockchainTradeClient::BlockchainTradeClient(BlockchainClientOptions options,
                                             std::shared_ptr<netws::WsTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("BlockchainTradeClient requires a transport");
    }
}

BlockchainTradeClient::~BlockchainTradeClient() {
    disconnecting_.store(true, std::memory_order_release);
    connected_.store(false, std::memory_order_release);
    transport_->close();
    join_receive_thread();
}

// ============================================================================
// CONNECTION LIFECYCLE
// ============================================================================

void BlockchainTradeClient::connect(const sync::CancellationToken& token) {
    bool restored = false;
    {
        std::lock_guard<std::mutex> lk(lifecycle_mutex_);
        token.throw_if_cancelled();
        if (is_connected()) {
            return;
        }

        // A receive loop that exited after a drop is still joinable.
        join_receive_thread();
        disconnecting_.store(false, std::memory_order_release);

        {
            auto registration = token.on_cancel([this]() { transport_->close(); });
            try {
                transport_->open(options_.url);
            } catch (const ConnectionError&) {
                if (token.is_cancelled()) {
                    throw OperationCancelled("connect cancelled");
                }
                throw;
            }
        }
        if (token.is_cancelled()) {
            transport_->close();
            throw OperationCancelled("connect cancelled");
        }

        connected_.store(true, std::memory_order_release);
        receive_thread_ = std::thread(&BlockchainTradeClient::receive_loop, this);
        restored = lost_.exchange(false);
        spdlog::info("[BlockchainTradeClient] connected to {}", options_.url);
    }

    if (restored) {
        connection_restored.emit();
    }
}

void BlockchainTradeClient::disconnect(const sync::CancellationToken&) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    disconnecting_.store(true, std::memory_order_release);
    const bool was_connected = connected_.exchange(false);
    transport_->close();
    join_receive_thread();
    if (was_connected) {
        spdlog::info("[BlockchainTradeClient] disconnected");
    }
}

void BlockchainTradeClient::join_receive_thread() {
    if (!receive_thread_.joinable()) {
        return;
    }
    if (receive_thread_.get_id() == std::this_thread::get_id()) {
        // Called from an event handler on the receive thread; it exits on its own.
        receive_thread_.detach();
        return;
    }
    receive_thread_.join();
}

// ============================================================================
// SUBSCRIPTIONS
// ============================================================================

void BlockchainTradeClient::subscribe_to_trades(market::Symbol symbol, const sync::CancellationToken& token) {
    send(TradeMessageCodec::encode_subscribe(symbol, options_.api_token), token);
    spdlog::info("[BlockchainTradeClient] subscribe sent for {}", market::to_string(symbol));
}

void BlockchainTradeClient::unsubscribe_from_trades(market::Symbol symbol, const sync::CancellationToken& token) {
    send(TradeMessageCodec::encode_unsubscribe(symbol, options_.api_token), token);
    spdlog::info("[BlockchainTradeClient] unsubscribe sent for {}", market::to_string(symbol));
}

void BlockchainTradeClient::send(const std::string& payload, const sync::CancellationToken& token) {
    token.throw_if_cancelled();
    if (!is_connected()) {
        throw ConnectionError("not connected to " + options_.url);
    }
    transport_->write(payload);
    spdlog::debug("[BlockchainTradeClient] sent: {}", payload);
}

// ============================================================================
// RECEIVE LOOP
// ============================================================================

void BlockchainTradeClient::receive_loop() {
    spdlog::debug("[BlockchainTradeClient] receive loop started");
    while (true) {
        std::string frame;
        try {
            frame = transport_->read();
        } catch (const std::exception& e) {
            connected_.store(false, std::memory_order_release);
            if (disconnecting_.load(std::memory_order_acquire)) {
                spdlog::debug("[BlockchainTradeClient] receive loop stopped");
                return;
            }
            spdlog::warn("[BlockchainTradeClient] connection lost: {}", e.what());
            lost_.store(true);
            transport_->close();
            try {
                connection_lost.emit();
            } catch (const std::exception& handler_error) {
                spdlog::error("[BlockchainTradeClient] connection_lost handler failed: {}", handler_error.what());
            }
            return;
        }

        try {
            handle_frame(frame);
        } catch (const std::exception& e) {
            spdlog::error("[BlockchainTradeClient] event handler failed: {}", e.what());
        }
    }
}

void BlockchainTradeClient::handle_frame(const std::string& frame) {
    spdlog::debug("[BlockchainTradeClient] received: {}", frame);

    auto decoded = TradeMessageCodec::decode(frame);
    switch (decoded.kind) {
        case DecodedMessage::Kind::TRADE:
            trade_received.emit(*decoded.trade);
            break;
        case DecodedMessage::Kind::SUBSCRIPTION:
            subscription_confirmed.emit(*decoded.subscription);
            break;
        case DecodedMessage::Kind::ERROR:
            decode_errors_.fetch_add(1);
            spdlog::warn("[BlockchainTradeClient] dropped frame: {}", decoded.error);
            break;
        case DecodedMessage::Kind::IGNORED:
            break;
    }
}

} // namespace tradecast::connector

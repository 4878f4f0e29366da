/**
 * @file beast_ws_transport.h
 * @brief WsTransport over Boost.Beast synchronous streams (OpenSSL for wss://)
 */

#pragma once

#include "core/net/ws_transport.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace tradecast::netws {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class BeastWsTransport : public WsTransport {
public:
    explicit BeastWsTransport(std::string user_agent = "tradecast/1.0");
    ~BeastWsTransport() override;

    BeastWsTransport(const BeastWsTransport&) = delete;
    BeastWsTransport& operator=(const BeastWsTransport&) = delete;

    void open(const std::string& url) override;
    std::string read() override;
    void write(const std::string& text) override;
    void close() override;
    bool is_open() const override { return open_.load(std::memory_order_acquire); }

private:
    template <typename Stream>
    void configure_and_handshake(Stream& stream, const WsUrl& url);
    void teardown_socket();
    void reset_streams();

    std::string user_agent_;

    net::io_context ioc_;
    std::unique_ptr<ssl::context> ssl_ctx_;
    std::unique_ptr<websocket::stream<ssl::stream<tcp::socket>>> wss_;
    std::unique_ptr<websocket::stream<tcp::socket>> ws_;
    beast::flat_buffer read_buffer_;

    // Guards stream creation/destruction against close() from another thread.
    std::mutex stream_mutex_;
    std::mutex write_mutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
};

} // namespace tradecast::netws

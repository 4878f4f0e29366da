/**
 * @file beast_ws_transport.cpp
 */

#include "core/net/beast_ws_transport.h"
#include "core/errors.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace tradecast::netws {

WsUrl parse_ws_url(const std::string& url) {
    WsUrl out;
    std::string scheme = "wss";
    std::string rest = url;
    auto pos = url.find("://");
    if (pos != std::string::npos) {
        scheme = url.substr(0, pos);
        rest = url.substr(pos + 3);
    }
    if (scheme != "ws" && scheme != "wss") {
        throw std::invalid_argument("unsupported WebSocket scheme '" + scheme + "' in " + url);
    }
    out.tls = (scheme == "wss");

    auto slash = rest.find('/');
    std::string hostport = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = out.tls ? "443" : "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
    }
    if (out.host.empty()) {
        throw std::invalid_argument("missing host in WebSocket URL " + url);
    }
    if (out.port.empty()) {
        throw std::invalid_argument("missing port in WebSocket URL " + url);
    }
    return out;
}

BeastWsTransport::BeastWsTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

BeastWsTransport::~BeastWsTransport() {
    close();
}

template <typename Stream>
void BeastWsTransport::configure_and_handshake(Stream& stream, const WsUrl& url) {
    auto& socket = beast::get_lowest_layer(stream);
    socket.set_option(net::socket_base::keep_alive(true));
    socket.set_option(tcp::no_delay(true));

    stream.set_option(websocket::stream_base::decorator([ua = user_agent_](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, ua);
    }));
    // Text mode is set once so writes never race the concurrent reader.
    stream.text(true);
    stream.handshake(url.host, url.target);
}

void BeastWsTransport::open(const std::string& url) {
    close();
    const WsUrl parsed = parse_ws_url(url);

    spdlog::info("[WS] connecting host={} port={} target={} tls={}",
                 parsed.host, parsed.port, parsed.target, parsed.tls ? "yes" : "no");

    try {
        {
            std::lock_guard<std::mutex> lk(stream_mutex_);
            reset_streams();
            closing_.store(false, std::memory_order_release);
            ioc_.restart();
            if (parsed.tls) {
                ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
                ssl_ctx_->set_default_verify_paths();
                ssl_ctx_->set_verify_mode(ssl::verify_peer);
                wss_ = std::make_unique<websocket::stream<ssl::stream<tcp::socket>>>(ioc_, *ssl_ctx_);
            } else {
                ws_ = std::make_unique<websocket::stream<tcp::socket>>(ioc_);
            }
        }

        tcp::resolver resolver(ioc_);
        const auto results = resolver.resolve(parsed.host, parsed.port);

        if (parsed.tls) {
            net::connect(wss_->next_layer().next_layer(), results.begin(), results.end());
            wss_->next_layer().set_verify_callback(ssl::host_name_verification(parsed.host));
            // SNI
            if (!::SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), parsed.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            wss_->next_layer().handshake(ssl::stream_base::client);
            configure_and_handshake(*wss_, parsed);
        } else {
            net::connect(ws_->next_layer(), results.begin(), results.end());
            configure_and_handshake(*ws_, parsed);
        }
    } catch (const std::exception& e) {
        teardown_socket();
        if (closing_.load(std::memory_order_acquire)) {
            throw ConnectionError("connect to " + url + " aborted");
        }
        throw ConnectionError("connect to " + url + " failed: " + e.what());
    }

    if (closing_.load(std::memory_order_acquire)) {
        teardown_socket();
        throw ConnectionError("connect to " + url + " aborted");
    }
    open_.store(true, std::memory_order_release);
    spdlog::info("[WS] connected host={} target={}", parsed.host, parsed.target);
}

std::string BeastWsTransport::read() {
    if (!is_open()) {
        throw ConnectionError("read on a closed WebSocket");
    }
    beast::error_code ec;
    read_buffer_.clear();
    if (wss_) {
        wss_->read(read_buffer_, ec);
    } else if (ws_) {
        ws_->read(read_buffer_, ec);
    } else {
        throw ConnectionError("no active WebSocket stream");
    }

    if (ec) {
        open_.store(false, std::memory_order_release);
        if (ec == websocket::error::closed) {
            throw ConnectionError("WebSocket closed by peer");
        }
        throw ConnectionError("WebSocket read failed: " + ec.message());
    }
    return beast::buffers_to_string(read_buffer_.data());
}

void BeastWsTransport::write(const std::string& text) {
    if (!is_open()) {
        throw ConnectionError("write on a closed WebSocket");
    }
    std::lock_guard<std::mutex> lk(write_mutex_);
    beast::error_code ec;
    if (wss_) {
        wss_->write(net::buffer(text), ec);
    } else if (ws_) {
        ws_->write(net::buffer(text), ec);
    } else {
        throw ConnectionError("no active WebSocket stream");
    }
    if (ec) {
        throw ConnectionError("WebSocket write failed: " + ec.message());
    }
    spdlog::debug("[WS] sent {} bytes", text.size());
}

void BeastWsTransport::close() {
    closing_.store(true, std::memory_order_release);
    const bool was_open = open_.exchange(false, std::memory_order_acq_rel);
    // websocket::close() is not safe against the concurrent reader; tear the socket down instead.
    teardown_socket();
    if (was_open) {
        spdlog::info("[WS] closed");
    }
}

void BeastWsTransport::teardown_socket() {
    std::lock_guard<std::mutex> lk(stream_mutex_);
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).cancel(ec);
        beast::get_lowest_layer(*wss_).close(ec);
    }
    if (ws_) {
        beast::get_lowest_layer(*ws_).cancel(ec);
        beast::get_lowest_layer(*ws_).close(ec);
    }
}

void BeastWsTransport::reset_streams() {
    wss_.reset();
    ws_.reset();
    ssl_ctx_.reset();
    read_buffer_.clear();
}

} // namespace tradecast::netws

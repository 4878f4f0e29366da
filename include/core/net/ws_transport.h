/**
 * @file ws_transport.h
 * @brief Blocking text-frame WebSocket transport used by the upstream feed client
 *
 * One reader thread may block in read() while another thread calls write(). close() may be
 * called from any thread and makes a pending open() or read() fail promptly.
 */

#pragma once

#include <string>

namespace tradecast::netws {

class WsTransport {
public:
    virtual ~WsTransport() = default;

    /// @throws ConnectionError if the connection or handshake fails
    virtual void open(const std::string& url) = 0;

    /// Next text frame. @throws ConnectionError on close, peer close or I/O failure
    virtual std::string read() = 0;

    /// @throws ConnectionError if not open or the write fails
    virtual void write(const std::string& text) = 0;

    /// Idempotent, never throws
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @struct WsUrl
 * @brief Parsed ws:// or wss:// URL
 */
struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
    bool tls = true;
};

/// @throws std::invalid_argument for a missing host or a scheme other than ws/wss
WsUrl parse_ws_url(const std::string& url);

} // namespace tradecast::netws

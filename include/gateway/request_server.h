/**
 * @file request_server.h
 * @brief ZMQ REP front end for RequestDispatcher
 */

#pragma once

#include "gateway/request_dispatcher.h"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace tradecast::gateway {

class RequestServer {
public:
    /**
     * @param context Shared ZMQ context
     * @param endpoint Bind endpoint, e.g. "tcp://*:5555"
     * @param dispatcher Must outlive the server
     * @param poll_timeout Upper bound on how long stop() waits for the loop to notice
     */
    RequestServer(std::shared_ptr<zmq::context_t> context,
                  std::string endpoint,
                  RequestDispatcher& dispatcher,
                  std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(200));
    ~RequestServer();

    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;

    /// Bind and start serving on a background thread. @throws zmq::error_t if bind fails
    void start();
    void stop();

    bool is_running() const { return running_.load(); }
    const std::string& endpoint() const { return endpoint_; }

private:
    void serve_loop();

    std::shared_ptr<zmq::context_t> context_;
    std::string endpoint_;
    RequestDispatcher& dispatcher_;
    std::chrono::milliseconds poll_timeout_;

    std::unique_ptr<zmq::socket_t> socket_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace tradecast::gateway

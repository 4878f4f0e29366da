/**
 * @file request_server.cpp
 */

#include "gateway/request_server.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <stdexcept>
#include <vector>

namespace tradecast::gateway {

RequestServer::RequestServer(std::shared_ptr<zmq::context_t> context,
                             std::string endpoint,
                             RequestDispatcher& dispatcher,
                             std::chrono::milliseconds poll_timeout)
    : context_(std::move(context)),
      endpoint_(std::move(endpoint)),
      dispatcher_(dispatcher),
      poll_timeout_(poll_timeout) {
    if (!context_) {
        throw std::invalid_argument("ZMQ context cannot be null");
    }
}

RequestServer::~RequestServer() {
    stop();
}

void RequestServer::start() {
    if (running_.load()) {
        return;
    }
    socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    socket_->set(zmq::sockopt::linger, 0);
    try {
        socket_->bind(endpoint_);
    } catch (const zmq::error_t& e) {
        spdlog::error("[RequestServer] failed to bind to {}: {}", endpoint_, e.what());
        socket_.reset();
        throw;
    }
    running_.store(true);
    thread_ = std::thread(&RequestServer::serve_loop, this);
    spdlog::info("[RequestServer] listening on {}", endpoint_);
}

void RequestServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    socket_.reset();
    spdlog::info("[RequestServer] stopped");
}

void RequestServer::serve_loop() {
    while (running_.load()) {
        try {
            std::vector<zmq::pollitem_t> items = {{socket_->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items.data(), items.size(), poll_timeout_);
            if (!(items[0].revents & ZMQ_POLLIN)) {
                continue;
            }

            zmq::message_t request;
            if (!socket_->recv(request, zmq::recv_flags::dontwait)) {
                continue;
            }
            const std::string request_text = request.to_string();
            spdlog::debug("[RequestServer] request: {}", request_text);

            // REP must answer every request before it can receive the next one.
            const std::string reply = dispatcher_.handle(request_text);
            zmq::message_t reply_msg(reply.data(), reply.size());
            if (!socket_->send(reply_msg, zmq::send_flags::none)) {
                spdlog::warn("[RequestServer] reply not sent");
            }
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) {
                spdlog::info("[RequestServer] context terminated");
                break;
            }
            spdlog::error("[RequestServer] socket error: {}", e.what());
        } catch (const std::exception& e) {
            spdlog::error("[RequestServer] unexpected error: {}", e.what());
        }
    }
}

} // namespace tradecast::gateway

/**
 * @file connection_manager.cpp
 */

#include "service/connection_manager.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tradecast::service {

namespace {
constexpr auto kStartLockPoll = std::chrono::milliseconds(50);

/// Lock @p mutex, giving up once @p token is cancelled
bool lock_cancellable(std::unique_lock<std::timed_mutex>& lock, const sync::CancellationToken& token) {
    while (!lock.try_lock_for(kStartLockPoll)) {
        if (token.is_cancelled()) {
            return false;
        }
    }
    return true;
}
} // namespace

backoff::BackoffOptions ConnectionManagerSettings::to_backoff_options() const {
    backoff::BackoffOptions options;
    options.type = backoff::BackoffType::EXPONENTIAL;
    options.initial_delay = initial_delay;
    options.max_delay = max_delay;
    options.multiplier = multiplier;
    return options;
}

ConnectionManager::ConnectionManager(std::shared_ptr<connector::Connectable> connectable,
                                     ConnectionManagerSettings settings,
                                     std::shared_ptr<backoff::DelayProvider> delay_provider)
    : connectable_(std::move(connectable)),
      settings_(settings),
      retry_connector_(backoff::make_backoff_strategy(settings.to_backoff_options()),
                       std::move(delay_provider)),
      current_backoff_ms_(settings.initial_delay.count()) {
    if (!connectable_) {
        throw std::invalid_argument("ConnectionManager requires a connectable");
    }
}

ConnectionManager::~ConnectionManager() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(worker_mutex_);
        stopping_ = true;
        if (reconnect_source_) {
            reconnect_source_->cancel();
        }
        worker = std::move(worker_);
    }
    worker_cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool ConnectionManager::is_connected() const {
    return connectable_->is_connected();
}

std::chrono::milliseconds ConnectionManager::current_backoff_delay() const {
    return std::chrono::milliseconds(current_backoff_ms_.load());
}

void ConnectionManager::reset_backoff() {
    current_backoff_ms_.store(settings_.initial_delay.count());
}

// ============================================================================
// START / STOP
// ============================================================================

void ConnectionManager::start(const sync::CancellationToken& token) {
    ensure_worker();

    if (is_connected()) {
        return;
    }

    std::unique_lock<std::timed_mutex> lock(start_mutex_, std::defer_lock);
    if (!lock_cancellable(lock, token)) {
        spdlog::info("[ConnectionManager] start cancelled while waiting for the start lock");
        return;
    }
    if (is_connected()) {
        // Another caller connected while we waited.
        return;
    }

    reset_backoff();
    spdlog::info("[ConnectionManager] connecting (initial backoff {} ms, max {} ms)",
                 settings_.initial_delay.count(), settings_.max_delay.count());

    try {
        retry_connector_.execute_with_retry(
            [this, &token]() {
                connectable_->connect(token);
                if (!connectable_->is_connected()) {
                    throw ConnectionError("connect returned without an open connection");
                }
            },
            token,
            [this](int attempt, std::chrono::milliseconds delay, const std::string& error) {
                current_backoff_ms_.store(delay.count());
                spdlog::warn("[ConnectionManager] connect attempt #{} failed: {}; retrying in {} ms",
                             attempt, error, delay.count());
            });
    } catch (const OperationCancelled&) {
        spdlog::info("[ConnectionManager] connect cancelled");
        return;
    }

    reset_backoff();
    spdlog::info("[ConnectionManager] connected");
}

void ConnectionManager::stop(const sync::CancellationToken& token) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(worker_mutex_);
        stopping_ = true;
        if (reconnect_source_) {
            reconnect_source_->cancel();
        }
        worker = std::move(worker_);
    }
    worker_cv_.notify_all();
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            std::lock_guard<std::mutex> lk(worker_mutex_);
            worker_ = std::move(worker);
            throw std::logic_error("ConnectionManager::stop called from its own reconnect worker");
        }
        worker.join();
    }

    // Let a caller's start() unwind before tearing the link down.
    std::unique_lock<std::timed_mutex> lock(start_mutex_, std::defer_lock);
    if (!lock_cancellable(lock, token)) {
        spdlog::warn("[ConnectionManager] stop proceeding without the start lock");
    }

    if (connectable_->is_connected()) {
        spdlog::info("[ConnectionManager] disconnecting");
        connectable_->disconnect(token);
    }
}

// ============================================================================
// RECONNECT WORKER
// ============================================================================

void ConnectionManager::ensure_worker() {
    std::lock_guard<std::mutex> lk(worker_mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopping_ = false;
    reconnect_requested_ = false;
    reconnect_source_ = std::make_unique<sync::CancellationSource>();
    worker_ = std::thread(&ConnectionManager::reconnect_loop, this);
}

void ConnectionManager::request_reconnect() {
    {
        std::lock_guard<std::mutex> lk(worker_mutex_);
        if (!worker_.joinable() || stopping_) {
            spdlog::debug("[ConnectionManager] reconnect request ignored (not running)");
            return;
        }
        reconnect_requested_ = true;
    }
    worker_cv_.notify_one();
}

void ConnectionManager::reconnect_loop() {
    while (true) {
        sync::CancellationToken token;
        {
            std::unique_lock<std::mutex> lk(worker_mutex_);
            worker_cv_.wait(lk, [this] { return stopping_ || reconnect_requested_; });
            if (stopping_) {
                return;
            }
            reconnect_requested_ = false;
            token = reconnect_source_->token();
        }

        spdlog::info("[ConnectionManager] connection lost, reconnecting");
        try {
            start(token);
        } catch (const std::exception& e) {
            spdlog::error("[ConnectionManager] reconnect failed: {}", e.what());
        }
    }
}

} // namespace tradecast::service

/**
 * @file connection_manager.h
 * @brief Upstream connection lifecycle: single-flight start, infinite retry with backoff,
 *        autonomous reconnect after a drop.
 *
 * State is never cached here: is_connected() asks the Connectable. Backoff resets to the
 * initial delay on every start() and after every successful connect, reconnects included.
 */

#pragma once

#include "connector/connectable.h"
#include "core/backoff/delay_provider.h"
#include "core/backoff/retry_connector.h"
#include "core/sync/cancellation.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace tradecast::service {

/**
 * @struct ConnectionManagerSettings
 * @brief Reconnect backoff configuration
 */
struct ConnectionManagerSettings {
    std::chrono::milliseconds initial_delay{std::chrono::seconds(5)};
    std::chrono::milliseconds max_delay{std::chrono::seconds(300)};
    double multiplier = 2.0;

    backoff::BackoffOptions to_backoff_options() const;
};

class ConnectionManager {
public:
    /**
     * @throws std::invalid_argument for a null connectable or invalid settings
     */
    ConnectionManager(std::shared_ptr<connector::Connectable> connectable,
                      ConnectionManagerSettings settings,
                      std::shared_ptr<backoff::DelayProvider> delay_provider =
                          std::make_shared<backoff::SleepDelayProvider>());
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Connect, retrying until success or cancellation
     *
     * No-op when already connected. Concurrent callers are serialized; the ones that get the
     * lock after a successful connect return immediately. Cancellation is a normal return.
     */
    void start(const sync::CancellationToken& token);

    /**
     * @brief Abort any reconnect in flight, join the reconnect worker, then disconnect
     */
    void stop(const sync::CancellationToken& token);

    bool is_connected() const;

    /**
     * @brief Schedule a reconnect on the worker thread and return immediately
     *
     * Ignored unless the manager has been started and not stopped since.
     */
    void request_reconnect();

    /// Delay used for the most recent backoff sleep, or the initial delay after a reset
    std::chrono::milliseconds current_backoff_delay() const;

    const ConnectionManagerSettings& settings() const { return settings_; }

private:
    void ensure_worker();
    void reconnect_loop();
    void reset_backoff();

    std::shared_ptr<connector::Connectable> connectable_;
    ConnectionManagerSettings settings_;
    backoff::RetryConnector retry_connector_;

    std::timed_mutex start_mutex_;
    std::atomic<int64_t> current_backoff_ms_;

    // Reconnect worker
    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    bool reconnect_requested_{false};
    bool stopping_{false};
    std::unique_ptr<sync::CancellationSource> reconnect_source_;
    std::thread worker_;
};

} // namespace tradecast::service

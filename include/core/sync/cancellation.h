/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared by retry loops, backoff sleeps and the receive loop.
 *
 * A CancellationSource owns the signal, CancellationToken is the cheap copyable view handed
 * to blocking operations. Waits are condition-variable based so a sleeping backoff returns as
 * soon as cancel() is called. Callbacks registered through on_cancel() let blocking I/O be
 * unblocked (e.g. closing a socket under a pending read).
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace tradecast::sync {

namespace detail {
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    bool running_callbacks{false};
    std::thread::id callback_thread;
    uint64_t next_id{1};
    std::map<uint64_t, std::function<void()>> callbacks;
};
} // namespace detail

/**
 * @brief RAII handle for a callback registered with CancellationToken::on_cancel().
 *
 * Once reset() (or the destructor) returns, the callback is guaranteed not to be running
 * on another thread.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

private:
    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_{0};
};

class CancellationToken {
public:
    /// A default token is never cancelled.
    CancellationToken() = default;

    bool is_cancelled() const;
    bool can_be_cancelled() const { return state_ != nullptr; }

    /// @throws OperationCancelled if the token is cancelled
    void throw_if_cancelled() const;

    /**
     * @brief Block for up to @p timeout or until cancellation.
     * @return true if the token was (or became) cancelled
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * @brief Register a callback run once on cancellation.
     *
     * Runs inline (and returns an empty registration) if already cancelled.
     */
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    /// Idempotent. Wakes every waiter and runs registered callbacks on the calling thread.
    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace tradecast::sync

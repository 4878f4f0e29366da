/**
 * @file cancellation.cpp
 */

#include "core/sync/cancellation.h"
#include "core/errors.h"

#include <vector>

namespace tradecast::sync {

// ---------------------------------------------------------------------------
// CancellationRegistration
// ---------------------------------------------------------------------------

CancellationRegistration::CancellationRegistration(std::weak_ptr<detail::CancellationState> state,
                                                   uint64_t id)
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) return;
    auto state = state_.lock();
    if (state) {
        std::unique_lock<std::mutex> lk(state->mutex);
        state->callbacks.erase(id_);
        // Wait out a concurrent cancel() that may be executing our callback, unless we are
        // being reset from inside that very callback.
        if (state->callback_thread != std::this_thread::get_id()) {
            state->cv.wait(lk, [&] { return !state->running_callbacks; });
        }
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------

bool CancellationToken::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lk(state_->mutex);
    return state_->cv.wait_for(lk, timeout, [&] { return state_->cancelled; });
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_ || !callback) return {};
    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        if (!state_->cancelled) {
            const uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }
    callback();
    return {};
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        state_->running_callbacks = true;
        state_->callback_thread = std::this_thread::get_id();
        for (const auto& entry : state_->callbacks) ids.push_back(entry.first);
    }
    state_->cv.notify_all();

    for (uint64_t id : ids) {
        std::function<void()> callback;
        {
            // A registration reset after the snapshot was taken is skipped.
            std::lock_guard<std::mutex> lk(state_->mutex);
            auto it = state_->callbacks.find(id);
            if (it == state_->callbacks.end()) continue;
            callback = std::move(it->second);
            state_->callbacks.erase(it);
        }
        callback();
    }

    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        state_->running_callbacks = false;
        state_->callback_thread = std::thread::id{};
    }
    state_->cv.notify_all();
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->cancelled;
}

} // namespace tradecast::sync

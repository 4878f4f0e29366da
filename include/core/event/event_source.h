/**
 * @file event_source.h
 * @brief Multi-listener event with explicit handler tokens.
 *
 * Handlers are invoked on the emitting thread, outside the internal lock, in registration
 * order. A handler may add or remove handlers (including itself) while being invoked; the
 * change applies from the next emit().
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradecast::event {

/// Capability returned by EventSource::add(), required to remove the handler again.
struct HandlerToken {
    uint64_t id{0};

    bool valid() const { return id != 0; }
    bool operator==(const HandlerToken& other) const { return id == other.id; }
};

template <typename... Args>
class EventSource {
public:
    using Handler = std::function<void(Args...)>;

    HandlerToken add(Handler handler) {
        std::lock_guard<std::mutex> lk(mutex_);
        HandlerToken token{next_id_++};
        handlers_.emplace_back(token.id, std::move(handler));
        return token;
    }

    /// @return false if the token was unknown (already removed or never issued)
    bool remove(HandlerToken token) {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == token.id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(Args... args) const {
        std::vector<std::pair<uint64_t, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            snapshot = handlers_;
        }
        for (const auto& entry : snapshot) {
            entry.second(args...);
        }
    }

    size_t handler_count() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    uint64_t next_id_{1};
    std::vector<std::pair<uint64_t, Handler>> handlers_;
};

} // namespace tradecast::event

/**
 * @file subscription_manager.cpp
 */

#include "service/subscription_manager.h"

#include <spdlog/spdlog.h>

namespace tradecast::service {

bool SubscriptionManager::should_subscribe_downstream(market::Symbol symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    const int count = ++ref_counts_[symbol];
    spdlog::debug("[SubscriptionManager] {} refcount -> {}", market::to_string(symbol), count);
    return count == 1;
}

bool SubscriptionManager::should_unsubscribe_downstream(market::Symbol symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = ref_counts_.find(symbol);
    if (it == ref_counts_.end()) {
        return false;
    }
    const int count = --it->second;
    spdlog::debug("[SubscriptionManager] {} refcount -> {}", market::to_string(symbol), count);
    if (count > 0) {
        return false;
    }
    ref_counts_.erase(it);
    return true;
}

std::vector<market::Symbol> SubscriptionManager::active_symbols() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<market::Symbol> symbols;
    symbols.reserve(ref_counts_.size());
    for (const auto& [symbol, count] : ref_counts_) {
        if (count > 0) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

int SubscriptionManager::ref_count(market::Symbol symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = ref_counts_.find(symbol);
    return it == ref_counts_.end() ? 0 : it->second;
}

} // namespace tradecast::service

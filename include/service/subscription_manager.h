/**
 * @file subscription_manager.h
 * @brief Reference counts downstream interest per symbol
 *
 * Only the 0 -> 1 and 1 -> 0 transitions require an upstream (un)subscribe, so any number of
 * downstream subscribers share one upstream subscription.
 */

#pragma once

#include "market/trade.h"

#include <map>
#include <mutex>
#include <vector>

namespace tradecast::service {

class SubscriptionManager {
public:
    /// Increment; @return true iff the count went 0 -> 1
    bool should_subscribe_downstream(market::Symbol symbol);

    /// Decrement, never below zero; @return true iff the count went 1 -> 0
    bool should_unsubscribe_downstream(market::Symbol symbol);

    /// Symbols with a positive count, in enum order
    std::vector<market::Symbol> active_symbols() const;

    int ref_count(market::Symbol symbol) const;

private:
    mutable std::mutex mutex_;
    std::map<market::Symbol, int> ref_counts_;
};

} // namespace tradecast::service

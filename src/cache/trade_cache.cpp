/**
 * @file trade_cache.cpp
 */

#include "cache/trade_cache.h"

#include <spdlog/spdlog.h>
#include <iterator>
#include <stdexcept>

namespace tradecast::cache {

namespace {

size_t checked_count(int count) {
    if (count < 0) {
        throw std::invalid_argument("count must be >= 0, got " + std::to_string(count));
    }
    return static_cast<size_t>(count);
}

template <typename ReverseIt>
std::vector<market::Trade> take(ReverseIt first, ReverseIt last, size_t count) {
    std::vector<market::Trade> out;
    for (; first != last && out.size() < count; ++first) {
        out.push_back(first->second);
    }
    return out;
}

} // namespace

// ============================================================================
// CachedTrades
// ============================================================================

bool CachedTrades::try_add(const market::Trade& trade) {
    if (!trade_ids_.insert(trade.trade_id()).second) {
        return false;
    }
    trades_.emplace(trade.timestamp(), trade);
    return true;
}

std::vector<market::Trade> CachedTrades::get_recent(size_t count) const {
    return take(trades_.rbegin(), trades_.rend(), count);
}

std::vector<market::Trade> CachedTrades::get_recent(size_t count, market::Timestamp before) const {
    // Everything before lower_bound(before) is strictly older.
    auto first = std::make_reverse_iterator(trades_.lower_bound(before));
    return take(first, trades_.rend(), count);
}

std::vector<market::Trade> CachedTrades::get_since(size_t count, market::Timestamp after) const {
    auto last = std::make_reverse_iterator(trades_.upper_bound(after));
    return take(trades_.rbegin(), last, count);
}

void CachedTrades::clear() {
    trades_.clear();
    trade_ids_.clear();
}

// ============================================================================
// TradeCache
// ============================================================================

bool TradeCache::try_add(const market::Trade& trade) {
    std::lock_guard<std::mutex> lk(mutex_);
    const bool added = by_symbol_[trade.symbol()].try_add(trade);
    if (!added) {
        spdlog::debug("[TradeCache] duplicate trade {} for {} ignored",
                      trade.trade_id(), market::to_string(trade.symbol()));
    }
    return added;
}

std::vector<market::Trade> TradeCache::get_recent(market::Symbol symbol, int count) const {
    const size_t n = checked_count(count);
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) {
        return {};
    }
    return it->second.get_recent(n);
}

std::vector<market::Trade> TradeCache::get_recent(market::Symbol symbol, int count,
                                                  market::Timestamp before) const {
    const size_t n = checked_count(count);
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) {
        return {};
    }
    return it->second.get_recent(n, before);
}

std::vector<market::Trade> TradeCache::get_since(market::Symbol symbol, int count,
                                                 market::Timestamp after) const {
    const size_t n = checked_count(count);
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end()) {
        return {};
    }
    return it->second.get_since(n, after);
}

void TradeCache::clear(market::Symbol symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_symbol_.find(symbol);
    if (it != by_symbol_.end()) {
        it->second.clear();
    }
}

void TradeCache::clear_all() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& [symbol, trades] : by_symbol_) {
        trades.clear();
    }
}

size_t TradeCache::count(market::Symbol symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = by_symbol_.find(symbol);
    return it == by_symbol_.end() ? 0 : it->second.count();
}

} // namespace tradecast::cache

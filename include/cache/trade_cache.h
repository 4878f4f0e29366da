/**
 * @file trade_cache.h
 * @brief In-memory per-symbol trade store with trade-id deduplication
 *
 * Queries always return trades newest first. Trades sharing a timestamp come back in reverse
 * arrival order. Nothing expires: a symbol's trades live until clear()/clear_all().
 */

#pragma once

#include "market/trade.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradecast::cache {

/**
 * @class CachedTrades
 * @brief Trades of a single symbol. Not synchronized; TradeCache serializes access.
 */
class CachedTrades {
public:
    /// @return false (and leaves the cache untouched) if trade_id is already stored
    bool try_add(const market::Trade& trade);

    std::vector<market::Trade> get_recent(size_t count) const;
    std::vector<market::Trade> get_recent(size_t count, market::Timestamp before) const;
    std::vector<market::Trade> get_since(size_t count, market::Timestamp after) const;

    void clear();
    size_t count() const { return trade_ids_.size(); }

private:
    // multimap keeps equal keys in insertion order, so reverse iteration is newest-first.
    std::multimap<market::Timestamp, market::Trade> trades_;
    std::unordered_set<std::string> trade_ids_;
};

/**
 * @class TradeCache
 * @brief Keyed store of CachedTrades guarded by one mutex
 *
 * Symbol cardinality is small, so a coarse lock is enough. Every query takes a count which
 * must be non-negative.
 */
class TradeCache {
public:
    bool try_add(const market::Trade& trade);

    /// @throws std::invalid_argument if count < 0
    std::vector<market::Trade> get_recent(market::Symbol symbol, int count) const;

    /// Only trades strictly older than @p before. @throws std::invalid_argument if count < 0
    std::vector<market::Trade> get_recent(market::Symbol symbol, int count, market::Timestamp before) const;

    /// The most recent trades strictly newer than @p after. @throws std::invalid_argument if count < 0
    std::vector<market::Trade> get_since(market::Symbol symbol, int count, market::Timestamp after) const;

    void clear(market::Symbol symbol);
    void clear_all();

    size_t count(market::Symbol symbol) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<market::Symbol, CachedTrades> by_symbol_;
};

} // namespace tradecast::cache

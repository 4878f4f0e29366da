/**
 * @file trade.h
 * @brief Trade value object and the enums of the upstream "trades" channel
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tradecast::market {

/// Microsecond-precision UTC timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * @enum Symbol
 * @brief Instruments relayed by the service
 */
enum class Symbol {
    BTC_USD,
    ETH_USD,
    SOL_USD
};

/**
 * @enum Side
 * @brief Aggressor side of the trade
 */
enum class Side {
    BUY,
    SELL
};

/**
 * @enum TradeEvent
 * @brief Event kind carried by every message of the trades channel
 */
enum class TradeEvent {
    SUBSCRIBED,
    UNSUBSCRIBED,
    REJECTED,
    SNAPSHOT,
    UPDATED
};

// ============================================================================
// STRING CONVERSION FUNCTIONS (wire form)
// ============================================================================

std::string to_string(Symbol symbol);     ///< "BTC-USD"
std::string to_string(Side side);         ///< "buy" / "sell"
std::string to_string(TradeEvent event);  ///< "subscribed", "updated", ...

std::optional<Symbol> parse_symbol(std::string_view value);
std::optional<Side> parse_side(std::string_view value);
std::optional<TradeEvent> parse_trade_event(std::string_view value);

/// All supported symbols, in enum order
inline constexpr std::array<Symbol, 3> kAllSymbols{Symbol::BTC_USD, Symbol::ETH_USD, Symbol::SOL_USD};

/**
 * @brief Format as ISO-8601 UTC with microseconds, e.g. "2024-01-15T10:30:00.123456Z"
 */
std::string format_timestamp(Timestamp ts);

/**
 * @brief Parse ISO-8601 "YYYY-MM-DDTHH:MM:SS[.ffffff](Z|+HH:MM|-HH:MM)"
 *
 * Fractional digits beyond microseconds are truncated.
 * @return std::nullopt for anything else
 */
std::optional<Timestamp> parse_timestamp(std::string_view value);

/**
 * @class Trade
 * @brief One executed trade on the upstream feed; immutable once built
 *
 * trade_id identifies the trade within its symbol.
 */
class Trade {
public:
    Trade(int64_t sequence_number,
          TradeEvent event,
          Symbol symbol,
          Timestamp timestamp,
          Side side,
          double quantity,
          double price,
          std::string trade_id)
        : sequence_number_(sequence_number),
          event_(event),
          symbol_(symbol),
          timestamp_(timestamp),
          side_(side),
          quantity_(quantity),
          price_(price),
          trade_id_(std::move(trade_id)) {}

    int64_t sequence_number() const { return sequence_number_; }
    TradeEvent event() const { return event_; }
    Symbol symbol() const { return symbol_; }
    Timestamp timestamp() const { return timestamp_; }
    Side side() const { return side_; }
    double quantity() const { return quantity_; }
    double price() const { return price_; }
    const std::string& trade_id() const { return trade_id_; }

private:
    int64_t sequence_number_;
    TradeEvent event_;
    Symbol symbol_;
    Timestamp timestamp_;
    Side side_;
    double quantity_;
    double price_;
    std::string trade_id_;
};

/**
 * @struct SubscriptionResponse
 * @brief Upstream acknowledgement of a subscribe / unsubscribe request
 */
struct SubscriptionResponse {
    int64_t sequence_number{0};
    TradeEvent event{TradeEvent::SUBSCRIBED};
    Symbol symbol{Symbol::BTC_USD};
};

} // namespace tradecast::market

/**
 * @file trade.cpp
 */

#include "market/trade.h"

#include <cctype>
#include <cstdio>

namespace tradecast::market {

std::string to_string(Symbol symbol) {
    switch (symbol) {
        case Symbol::BTC_USD: return "BTC-USD";
        case Symbol::ETH_USD: return "ETH-USD";
        case Symbol::SOL_USD: return "SOL-USD";
        default: return "UNKNOWN";
    }
}

std::string to_string(Side side) {
    return side == Side::BUY ? "buy" : "sell";
}

std::string to_string(TradeEvent event) {
    switch (event) {
        case TradeEvent::SUBSCRIBED: return "subscribed";
        case TradeEvent::UNSUBSCRIBED: return "unsubscribed";
        case TradeEvent::REJECTED: return "rejected";
        case TradeEvent::SNAPSHOT: return "snapshot";
        case TradeEvent::UPDATED: return "updated";
        default: return "unknown";
    }
}

std::optional<Symbol> parse_symbol(std::string_view value) {
    for (Symbol symbol : kAllSymbols) {
        if (value == to_string(symbol)) {
            return symbol;
        }
    }
    return std::nullopt;
}

std::optional<Side> parse_side(std::string_view value) {
    if (value == "buy") return Side::BUY;
    if (value == "sell") return Side::SELL;
    return std::nullopt;
}

std::optional<TradeEvent> parse_trade_event(std::string_view value) {
    if (value == "subscribed") return TradeEvent::SUBSCRIBED;
    if (value == "unsubscribed") return TradeEvent::UNSUBSCRIBED;
    if (value == "rejected") return TradeEvent::REJECTED;
    if (value == "snapshot") return TradeEvent::SNAPSHOT;
    if (value == "updated") return TradeEvent::UPDATED;
    return std::nullopt;
}

// ============================================================================
// TIMESTAMPS
// ============================================================================

namespace {

// Howard Hinnant's civil calendar conversions (proleptic Gregorian, UTC).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool read_digits(std::string_view s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

constexpr unsigned kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return static_cast<int>(kDaysInMonth[month - 1]);
}

} // namespace

std::string format_timestamp(Timestamp ts) {
    const int64_t total_us = ts.time_since_epoch().count();
    int64_t days = total_us / 86'400'000'000LL;
    int64_t rem_us = total_us % 86'400'000'000LL;
    if (rem_us < 0) {
        rem_us += 86'400'000'000LL;
        --days;
    }
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const int64_t secs = rem_us / 1'000'000;
    const int64_t micros = rem_us % 1'000'000;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lldZ",
                  static_cast<long long>(year), month, day,
                  static_cast<long long>(secs / 3600),
                  static_cast<long long>((secs / 60) % 60),
                  static_cast<long long>(secs % 60),
                  static_cast<long long>(micros));
    return buf;
}

std::optional<Timestamp> parse_timestamp(std::string_view s) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') ||
        !read_digits(s, pos, 2, minute) || !expect(s, pos, ':') ||
        !read_digits(s, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        const int sign = s[pos] == '-' ? -1 : 1;
        ++pos;
        int off_h = 0, off_m = 0;
        if (!read_digits(s, pos, 2, off_h)) {
            return std::nullopt;
        }
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
        }
        if (!read_digits(s, pos, 2, off_m) || off_h > 23 || off_m > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) {
        return std::nullopt;
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return Timestamp(std::chrono::microseconds(seconds * 1'000'000 + micros));
}

} // namespace tradecast::market

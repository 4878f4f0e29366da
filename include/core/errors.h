/**
 * @file errors.h
 * @brief Exception types shared by the relay core and its adapters.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tradecast {

/**
 * @brief Raised when an operation observes a cancelled token.
 *
 * Never retried. Loops that own the token convert it into a normal return.
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Transport level failure (connect, send, receive, peer close).
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tradecast

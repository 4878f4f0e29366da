/**
 * @file backoff_strategy.h
 * @brief Reconnect delay policies (attempt number -> delay).
 *
 * Strategies are pure functions of their options and the attempt number, so a backoff
 * sequence can be asserted exactly in tests.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace tradecast::backoff {

enum class BackoffType {
    EXPONENTIAL,
    LINEAR
};

std::string to_string(BackoffType type);

/**
 * @struct BackoffOptions
 * @brief Delay policy configuration
 */
struct BackoffOptions {
    BackoffType type = BackoffType::EXPONENTIAL;
    std::chrono::milliseconds initial_delay{std::chrono::seconds(5)};   ///< Delay before the first retry
    std::chrono::milliseconds max_delay{std::chrono::seconds(300)};     ///< Upper bound for any delay
    double multiplier = 2.0;                                            ///< Growth factor (exponential only)

    /// @throws std::invalid_argument on non-positive delays, max < initial or multiplier < 1
    void validate() const;
};

class BackoffStrategy {
public:
    virtual ~BackoffStrategy() = default;

    /**
     * @brief Delay to wait before retry number @p attempt_number
     * @param attempt_number 1-based; the first retry uses the initial delay
     * @throws std::invalid_argument if attempt_number < 1
     */
    virtual std::chrono::milliseconds get_delay(int attempt_number) const = 0;
};

/// min(initial * multiplier^(attempt-1), max)
class ExponentialBackoffStrategy : public BackoffStrategy {
public:
    explicit ExponentialBackoffStrategy(const BackoffOptions& options);
    std::chrono::milliseconds get_delay(int attempt_number) const override;

private:
    BackoffOptions options_;
};

/// min(initial * attempt, max)
class LinearBackoffStrategy : public BackoffStrategy {
public:
    explicit LinearBackoffStrategy(const BackoffOptions& options);
    std::chrono::milliseconds get_delay(int attempt_number) const override;

private:
    BackoffOptions options_;
};

/// @throws std::invalid_argument for invalid options or an unsupported type
std::unique_ptr<BackoffStrategy> make_backoff_strategy(const BackoffOptions& options);

} // namespace tradecast::backoff

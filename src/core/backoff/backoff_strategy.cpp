/**
 * @file backoff_strategy.cpp
 */

#include "core/backoff/backoff_strategy.h"

#include <cmath>
#include <stdexcept>

namespace tradecast::backoff {

namespace {

inline void check_attempt(int attempt_number) {
    if (attempt_number < 1) {
        throw std::invalid_argument("attempt number must be >= 1, got " + std::to_string(attempt_number));
    }
}

inline std::chrono::milliseconds clamp_to_max(double delay_ms, std::chrono::milliseconds max_delay) {
    // Large attempt numbers overflow to inf; anything past max is max.
    if (!std::isfinite(delay_ms) || delay_ms >= static_cast<double>(max_delay.count())) {
        return max_delay;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay_ms)));
}

} // namespace

std::string to_string(BackoffType type) {
    switch (type) {
        case BackoffType::EXPONENTIAL: return "EXPONENTIAL";
        case BackoffType::LINEAR: return "LINEAR";
        default: return "UNKNOWN";
    }
}

void BackoffOptions::validate() const {
    if (initial_delay.count() <= 0) {
        throw std::invalid_argument("initial backoff delay must be positive");
    }
    if (max_delay < initial_delay) {
        throw std::invalid_argument("max backoff delay must be >= initial delay");
    }
    if (!(multiplier >= 1.0)) {
        throw std::invalid_argument("backoff multiplier must be >= 1.0");
    }
}

// ============================================================================
// EXPONENTIAL
// ============================================================================

ExponentialBackoffStrategy::ExponentialBackoffStrategy(const BackoffOptions& options)
    : options_(options) {
    options_.validate();
}

std::chrono::milliseconds ExponentialBackoffStrategy::get_delay(int attempt_number) const {
    check_attempt(attempt_number);
    const double delay_ms = static_cast<double>(options_.initial_delay.count()) *
                            std::pow(options_.multiplier, attempt_number - 1);
    return clamp_to_max(delay_ms, options_.max_delay);
}

// ============================================================================
// LINEAR
// ============================================================================

LinearBackoffStrategy::LinearBackoffStrategy(const BackoffOptions& options)
    : options_(options) {
    options_.validate();
}

std::chrono::milliseconds LinearBackoffStrategy::get_delay(int attempt_number) const {
    check_attempt(attempt_number);
    const double delay_ms = static_cast<double>(options_.initial_delay.count()) * attempt_number;
    return clamp_to_max(delay_ms, options_.max_delay);
}

std::unique_ptr<BackoffStrategy> make_backoff_strategy(const BackoffOptions& options) {
    switch (options.type) {
        case BackoffType::EXPONENTIAL:
            return std::make_unique<ExponentialBackoffStrategy>(options);
        case BackoffType::LINEAR:
            return std::make_unique<LinearBackoffStrategy>(options);
    }
    throw std::invalid_argument("backoff strategy '" + to_string(options.type) + "' is not supported");
}

} // namespace tradecast::backoff

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

namespace retryable {

enum class BackoffStrategy : uint8_t { LINEAR = 0, EXPONENTIAL = 1 };

// Delays are expressed in (fractional) seconds.
using Seconds = std::chrono::duration<double>;

// Classifies a caught error; returns true when the error matches.
using ErrorPredicate = std::function<bool(const std::exception_ptr& error)>;

// Called with (attempt, error) right before the executor suspends for a retry.
using BeforeRetryHook = std::function<void(int attempt, const std::exception_ptr& error)>;

// Called with the number of attempts used once the work succeeds.
using SuccessHook = std::function<void(int attempts)>;

// Called with (attempts, error) right before a terminal error is rethrown.
using FailureHook = std::function<void(int attempts, const std::exception_ptr& error)>;

std::string ToString(BackoffStrategy strategy);

/**
 * Parses "linear" or "exponential" (case-insensitive).
 *
 * @throws std::invalid_argument on any other name
 */
BackoffStrategy ParseBackoffStrategy(const std::string& name);

} // namespace retryable

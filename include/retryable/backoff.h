#pragma once

#include <chrono>
#include <random>

#include "retryable/retry_config.h"
#include "retryable/types.h"

namespace retryable {

/**
 * Delay before the retry that follows a failed attempt, without jitter and
 * without the max_delay cap.
 *
 * LINEAR: base_delay * attempt, EXPONENTIAL: base_delay * 2^(attempt - 1).
 *
 * @param attempt number of the attempt that just failed, starting at 1
 * @throws std::invalid_argument if attempt < 1
 */
Seconds NominalDelay(int attempt, const RetryConfig& config);

/**
 * @return a uniformly distributed factor in [0.5, 1.5)
 */
double JitterFactor(std::mt19937& gen);

/**
 * Nominal delay, scaled by JitterFactor() when jitter is enabled, then capped
 * by max_delay when one is set.
 */
Seconds ComputeDelay(int attempt, const RetryConfig& config, std::mt19937& gen);

// Same as above with a per-thread random engine.
Seconds ComputeDelay(int attempt, const RetryConfig& config);

/**
 * Converts a delay to a sleep duration, saturating instead of overflowing.
 */
std::chrono::nanoseconds ToSleepDuration(Seconds delay);

} // namespace retryable

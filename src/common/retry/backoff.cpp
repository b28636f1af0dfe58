#include "retryable/backoff.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace retryable {

Seconds NominalDelay(int attempt, const RetryConfig& config) {
    if (attempt < 1) {
        throw std::invalid_argument("Attempt number must be at least 1, got " + std::to_string(attempt));
    }
    double base = std::max(config.base_delay.count(), 0.0);
    switch (config.backoff) {
        case BackoffStrategy::EXPONENTIAL:
            // ldexp saturates to inf instead of overflowing an integer shift
            return Seconds(std::ldexp(base, attempt - 1));
        case BackoffStrategy::LINEAR:
        default:
            return Seconds(base * attempt);
    }
}

double JitterFactor(std::mt19937& gen) {
    std::uniform_real_distribution<double> dis(0.5, 1.5);
    double factor = dis(gen);
    // uniform_real_distribution may round up to its upper bound
    if (factor >= 1.5) {
        factor = std::nextafter(1.5, 0.0);
    }
    return factor;
}

Seconds ComputeDelay(int attempt, const RetryConfig& config, std::mt19937& gen) {
    Seconds delay = NominalDelay(attempt, config);
    if (config.jitter) {
        delay *= JitterFactor(gen);
    }
    if (config.max_delay.has_value()) {
        delay = std::min(delay, std::max(*config.max_delay, Seconds(0.0)));
    }
    return delay;
}

Seconds ComputeDelay(int attempt, const RetryConfig& config) {
    // use randomness to avoid contention between many callers sharing the
    // same retry config
    static thread_local std::random_device random_device;
    static thread_local std::mt19937 gen(random_device());
    return ComputeDelay(attempt, config, gen);
}

std::chrono::nanoseconds ToSleepDuration(Seconds delay) {
    if (!(delay.count() > 0.0)) {
        return std::chrono::nanoseconds(0);
    }
    if (delay >= std::chrono::duration_cast<Seconds>(std::chrono::nanoseconds::max())) {
        return std::chrono::nanoseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(delay);
}

} // namespace retryable

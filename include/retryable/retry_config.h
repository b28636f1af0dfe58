#pragma once

#include <optional>
#include <string>

#include "retryable/error_filter.h"
#include "retryable/types.h"

namespace retryable {

class RetryConfigBuilder;

constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr double DEFAULT_BASE_DELAY_SEC = 1.0;

/**
 * Configuration of one retry loop.
 */
struct RetryConfig {
    // Total number of attempts, the first one included.
    int max_attempts{DEFAULT_MAX_ATTEMPTS};
    ErrorPredicate retry_on{RetryOnStandardErrors()};
    // Never retried, even when retry_on matches.
    ErrorPredicate except{NonRetryableErrors()};
    // Optional extra filter applied to errors matched by retry_on.
    ErrorPredicate condition;
    Seconds base_delay{DEFAULT_BASE_DELAY_SEC};
    BackoffStrategy backoff{BackoffStrategy::LINEAR};
    bool jitter{false};
    std::optional<Seconds> max_delay;
    BeforeRetryHook before_retry;
    SuccessHook on_success;
    FailureHook on_failure;

    [[nodiscard]] std::string ToString() const;

    using Builder = RetryConfigBuilder;
};

/**
 * Builder for RetryConfig. Starts from the defaults and overrides one
 * field per call.
 */
class RetryConfigBuilder {
 public:
    RetryConfigBuilder();

    /**
     * @param base the config to start from instead of the defaults
     */
    explicit RetryConfigBuilder(RetryConfig base);

    RetryConfigBuilder& WithMaxAttempts(int max_attempts);

    /**
     * Retry only errors of the given exception types.
     */
    template <typename... Errors>
    RetryConfigBuilder& RetryOn() {
        config_.retry_on = ::retryable::RetryOn<Errors...>();
        return *this;
    }

    RetryConfigBuilder& RetryIf(ErrorPredicate predicate);

    /**
     * Never retry errors of the given exception types.
     */
    template <typename... Errors>
    RetryConfigBuilder& Except() {
        config_.except = ::retryable::RetryOn<Errors...>();
        return *this;
    }

    RetryConfigBuilder& ExceptIf(ErrorPredicate predicate);
    RetryConfigBuilder& WithCondition(ErrorPredicate condition);
    RetryConfigBuilder& WithBaseDelay(Seconds base_delay);
    RetryConfigBuilder& WithBackoff(BackoffStrategy backoff);
    RetryConfigBuilder& WithJitter(bool jitter = true);
    RetryConfigBuilder& WithMaxDelay(Seconds max_delay);
    RetryConfigBuilder& WithoutMaxDelay();
    RetryConfigBuilder& BeforeRetry(BeforeRetryHook hook);
    RetryConfigBuilder& OnSuccess(SuccessHook hook);
    RetryConfigBuilder& OnFailure(FailureHook hook);

    /**
     * @return the normalized config
     */
    RetryConfig Build() const;

 private:
    RetryConfig config_;
};

/**
 * @return a fresh config holding the default values
 */
RetryConfig DefaultRetryConfig();

/**
 * Clamps out-of-range values: max_attempts below 1 becomes 1, negative
 * base_delay and max_delay become 0, an empty retry_on predicate becomes
 * RetryOnStandardErrors().
 */
RetryConfig NormalizeRetryConfig(RetryConfig config);

} // namespace retryable

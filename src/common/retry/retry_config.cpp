#include "retryable/retry_config.h"

#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace retryable {

std::string RetryConfig::ToString() const {
    std::ostringstream oss;
    oss << "RetryConfig{max_attempts=" << max_attempts << ", base_delay=" << base_delay.count() << "s"
        << ", backoff=" << ::retryable::ToString(backoff) << ", jitter=" << (jitter ? "true" : "false")
        << ", max_delay=";
    if (max_delay.has_value()) {
        oss << max_delay->count() << "s";
    } else {
        oss << "none";
    }
    oss << ", condition=" << (condition ? "set" : "none") << ", before_retry=" << (before_retry ? "set" : "none")
        << ", on_success=" << (on_success ? "set" : "none") << ", on_failure=" << (on_failure ? "set" : "none")
        << "}";
    return oss.str();
}

RetryConfig DefaultRetryConfig() {
    return RetryConfig{};
}

RetryConfig NormalizeRetryConfig(RetryConfig config) {
    if (config.max_attempts < 1) {
        SPDLOG_WARN("max_attempts {} is less than 1, clamp to 1", config.max_attempts);
        config.max_attempts = 1;
    }
    // NaN fails every comparison, so test for the valid range
    if (!(config.base_delay.count() >= 0.0)) {
        SPDLOG_WARN("base_delay {}s is negative, clamp to 0", config.base_delay.count());
        config.base_delay = Seconds(0.0);
    }
    if (config.max_delay.has_value() && !(config.max_delay->count() >= 0.0)) {
        SPDLOG_WARN("max_delay {}s is negative, clamp to 0", config.max_delay->count());
        config.max_delay = Seconds(0.0);
    }
    if (!config.retry_on) {
        config.retry_on = RetryOnStandardErrors();
    }
    return config;
}

RetryConfigBuilder::RetryConfigBuilder()
    : config_(DefaultRetryConfig()) {
}

RetryConfigBuilder::RetryConfigBuilder(RetryConfig base)
    : config_(std::move(base)) {
}

RetryConfigBuilder& RetryConfigBuilder::WithMaxAttempts(int max_attempts) {
    config_.max_attempts = max_attempts;
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::RetryIf(ErrorPredicate predicate) {
    config_.retry_on = std::move(predicate);
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::ExceptIf(ErrorPredicate predicate) {
    config_.except = std::move(predicate);
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithCondition(ErrorPredicate condition) {
    config_.condition = std::move(condition);
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithBaseDelay(Seconds base_delay) {
    config_.base_delay = base_delay;
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithBackoff(BackoffStrategy backoff) {
    config_.backoff = backoff;
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithJitter(bool jitter) {
    config_.jitter = jitter;
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithMaxDelay(Seconds max_delay) {
    config_.max_delay = max_delay;
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::WithoutMaxDelay() {
    config_.max_delay.reset();
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::BeforeRetry(BeforeRetryHook hook) {
    config_.before_retry = std::move(hook);
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::OnSuccess(SuccessHook hook) {
    config_.on_success = std::move(hook);
    return *this;
}

RetryConfigBuilder& RetryConfigBuilder::OnFailure(FailureHook hook) {
    config_.on_failure = std::move(hook);
    return *this;
}

RetryConfig RetryConfigBuilder::Build() const {
    return NormalizeRetryConfig(config_);
}

} // namespace retryable

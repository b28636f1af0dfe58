#include "retryable/retry_executor.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "retryable/backoff.h"
#include "retryable/error_filter.h"

namespace retryable {

RetryExecutor::RetryExecutor(RetryConfig config, std::shared_ptr<Suspender> suspender)
    : config_(NormalizeRetryConfig(std::move(config))),
      suspender_(std::move(suspender)) {
    if (suspender_ == nullptr) {
        suspender_ = std::make_shared<ThreadSuspender>();
    }
}

const RetryConfig& RetryExecutor::GetConfig() const {
    return config_;
}

bool RetryExecutor::ShouldRetry(const AttemptState& state, const std::exception_ptr& error) const {
    if (config_.except && config_.except(error)) {
        return false;
    }
    if (!config_.retry_on(error)) {
        return false;
    }
    if (config_.condition && !config_.condition(error)) {
        return false;
    }
    return !state.IsExhausted();
}

void RetryExecutor::NotifySuccess(const AttemptState& state) const {
    if (config_.on_success) {
        config_.on_success(state.GetAttemptCount());
    }
}

void RetryExecutor::NotifyFailure(const AttemptState& state, const std::exception_ptr& error) const {
    if (config_.on_failure) {
        config_.on_failure(state.GetAttemptCount(), error);
    }
}

void RetryExecutor::PrepareRetry(const AttemptState& state, const std::exception_ptr& error, std::string_view action) {
    int attempt = state.GetAttemptCount();
    if (config_.before_retry) {
        config_.before_retry(attempt, error);
    }

    Seconds delay = ComputeDelay(attempt, config_);
    SPDLOG_WARN(
        "Failed to {} on attempt {}/{}: {}, retry in {:.3f}s",
        action,
        attempt,
        state.GetMaxAttempts(),
        DescribeError(error),
        delay.count());

    suspender_->Suspend(ToSleepDuration(delay));
}

} // namespace retryable

#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "common/option.h"
#include "common/retry/retry_options.h"
#include "retryable/retry_config.h"
#include "retryable/retry_executor.h"
#include "retryable/suspender.h"

namespace retryable {

/**
 * Utilities for performing retries.
 */
class RetryUtils {
 public:
    RetryUtils() = delete; // prevent instantiation

    /**
     * Retries the given callable until it doesn't throw an exception or the
     * attempt budget is used up. The last exception is rethrown unchanged when
     * retries are exhausted or the exception is not retryable.
     *
     * @param action a description of the action that fits the phrase "Failed to
     * ${action}"
     * @param func the callable to retry
     * @param config the retry configuration to use
     * @param suspender how to wait between attempts, the calling thread sleeps
     * if null
     * @return the result of the callable
     */
    template <typename Work>
    static std::invoke_result_t<Work&> Retry(
        const std::string& action,
        Work&& func,
        const RetryConfig& config = DefaultRetryConfig(),
        std::shared_ptr<Suspender> suspender = nullptr);

    /**
     * Same as above, with the configuration read from the RETRYABLE_* keys of
     * options.
     */
    template <typename Work>
    static std::invoke_result_t<Work&> Retry(
        const std::string& action,
        Work&& func,
        const Options& options,
        std::shared_ptr<Suspender> suspender = nullptr);

    /**
     * @return the best effort config with no retry
     */
    static RetryConfig NoRetryConfig();
};

template <typename Work>
std::invoke_result_t<Work&> RetryUtils::Retry(
    const std::string& action,
    Work&& func,
    const RetryConfig& config,
    std::shared_ptr<Suspender> suspender) {
    RetryExecutor executor(config, std::move(suspender));
    return executor.Execute(std::forward<Work>(func), action);
}

template <typename Work>
std::invoke_result_t<Work&> RetryUtils::Retry(
    const std::string& action,
    Work&& func,
    const Options& options,
    std::shared_ptr<Suspender> suspender) {
    RetryExecutor executor(LoadRetryConfig(options), std::move(suspender));
    return executor.Execute(std::forward<Work>(func), action);
}

} // namespace retryable

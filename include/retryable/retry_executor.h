#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "retryable/attempt_state.h"
#include "retryable/retry_config.h"
#include "retryable/suspender.h"

namespace retryable {

constexpr std::string_view DEFAULT_ACTION = "run retryable operation";

/**
 * Runs a unit of work, re-running it after a delay when it throws a
 * retryable error, until it succeeds or the attempt budget is used up.
 *
 * Terminal errors are the original exception objects, rethrown unchanged.
 * An executor holds no per-call state; the same instance may serve
 * concurrent calls as long as its hooks and suspender allow it.
 */
class RetryExecutor {
 public:
    /**
     * @param config retry configuration, normalized on construction
     * @param suspender how to wait between attempts; ThreadSuspender if null
     */
    explicit RetryExecutor(RetryConfig config = DefaultRetryConfig(), std::shared_ptr<Suspender> suspender = nullptr);

    /**
     * Runs work until it returns or fails terminally.
     *
     * @param work zero-argument callable
     * @param action a description of the action that fits the phrase "Failed
     * to ${action}", used in log lines
     * @return whatever work returned on its successful attempt
     */
    template <typename Work>
    std::invoke_result_t<Work&> Execute(Work&& work, std::string_view action = DEFAULT_ACTION);

    [[nodiscard]] const RetryConfig& GetConfig() const;

 private:
    [[nodiscard]] bool ShouldRetry(const AttemptState& state, const std::exception_ptr& error) const;
    void NotifySuccess(const AttemptState& state) const;
    void NotifyFailure(const AttemptState& state, const std::exception_ptr& error) const;
    void PrepareRetry(const AttemptState& state, const std::exception_ptr& error, std::string_view action);

    RetryConfig config_;
    std::shared_ptr<Suspender> suspender_;
};

template <typename Work>
std::invoke_result_t<Work&> RetryExecutor::Execute(Work&& work, std::string_view action) {
    using Result = std::invoke_result_t<Work&>;
    static_assert(!std::is_reference_v<Result>, "Retried work must return by value");

    AttemptState state(config_.max_attempts);
    while (state.Attempt()) {
        std::exception_ptr error;
        if constexpr (std::is_void_v<Result>) {
            try {
                work();
            } catch (...) {
                error = std::current_exception();
            }
            if (!error) {
                NotifySuccess(state);
                return;
            }
        } else {
            std::optional<Result> result;
            try {
                result.emplace(work());
            } catch (...) {
                error = std::current_exception();
            }
            if (result.has_value()) {
                NotifySuccess(state);
                return std::move(*result);
            }
        }

        if (!ShouldRetry(state, error)) {
            NotifyFailure(state, error);
            std::rethrow_exception(error);
        }
        // Not inside the handler: a cooperative suspender switches stacks here.
        PrepareRetry(state, error, action);
    }
    throw std::logic_error("Retry failed without exception");
}

} // namespace retryable

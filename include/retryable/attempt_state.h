#pragma once

namespace retryable {

/**
 * Attempt bookkeeping for a single retry loop. Owned by one call and never
 * shared.
 */
class AttemptState {
 public:
    /**
     * @param max_attempts total number of attempts, including the first one;
     * values below 1 allow a single attempt
     */
    explicit AttemptState(int max_attempts);

    /**
     * Starts the next attempt.
     *
     * @return false when the attempt budget is already used up
     */
    bool Attempt();

    [[nodiscard]] int GetAttemptCount() const;
    [[nodiscard]] int GetMaxAttempts() const;

    // True when no further attempt may be started.
    [[nodiscard]] bool IsExhausted() const;

 private:
    int max_attempts_;
    int attempt_count_;
};

} // namespace retryable

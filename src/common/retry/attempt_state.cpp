#include "retryable/attempt_state.h"

#include <algorithm>

namespace retryable {

AttemptState::AttemptState(int max_attempts)
    : max_attempts_(std::max(max_attempts, 1)),
      attempt_count_(0) {
}

bool AttemptState::Attempt() {
    if (attempt_count_ < max_attempts_) {
        attempt_count_++;
        return true;
    }
    return false;
}

int AttemptState::GetAttemptCount() const {
    return attempt_count_;
}

int AttemptState::GetMaxAttempts() const {
    return max_attempts_;
}

bool AttemptState::IsExhausted() const {
    return attempt_count_ >= max_attempts_;
}

} // namespace retryable

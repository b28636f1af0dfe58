#include "common/retry/retry_utils.h"

namespace retryable {

RetryConfig RetryUtils::NoRetryConfig() {
    return RetryConfig::Builder().WithMaxAttempts(1).WithBaseDelay(Seconds(0.0)).Build();
}

} // namespace retryable

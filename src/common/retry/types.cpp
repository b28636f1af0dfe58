#include "retryable/types.h"

#include <stdexcept>

#include "common/string_utils.h"

namespace retryable {

std::string ToString(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::LINEAR:
            return "LINEAR";
        case BackoffStrategy::EXPONENTIAL:
            return "EXPONENTIAL";
        default:
            break;
    }
    return "UNKNOWN";
}

BackoffStrategy ParseBackoffStrategy(const std::string& name) {
    auto lower = ToLower(TrimCopy(name));
    if (lower == "linear") {
        return BackoffStrategy::LINEAR;
    }
    if (lower == "exponential") {
        return BackoffStrategy::EXPONENTIAL;
    }
    throw std::invalid_argument("Invalid backoff strategy: " + name);
}

} // namespace retryable

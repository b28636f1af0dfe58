#include "retryable/error_filter.h"

namespace retryable {

ErrorPredicate RetryOnStandardErrors() {
    return RetryOn<std::exception>();
}

ErrorPredicate NonRetryableErrors() {
    return RetryOn<NonRetryableException>();
}

ErrorPredicate NoErrors() {
    return [](const std::exception_ptr& /*error*/) { return false; };
}

std::string DescribeError(const std::exception_ptr& error) {
    if (error == nullptr) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace retryable

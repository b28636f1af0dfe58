#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "retryable/types.h"

namespace retryable {

/**
 * Base exception class for non-retryable errors.
 * When this exception is thrown, retry operations are abandoned immediately,
 * whatever the configured retryable error set is.
 */
class NonRetryableException : public std::runtime_error {
 public:
    explicit NonRetryableException(const std::string& msg)
        : std::runtime_error(msg) {}
};

namespace detail {

template <typename Error, typename... Rest>
bool MatchesAnyOf(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const Error&) {
        return true;
    } catch (...) {
        if constexpr (sizeof...(Rest) > 0) {
            return MatchesAnyOf<Rest...>(error);
        } else {
            return false;
        }
    }
}

} // namespace detail

/**
 * Builds a predicate matching errors of any of the given exception types
 * (or types derived from them).
 */
template <typename... Errors>
ErrorPredicate RetryOn() {
    static_assert(sizeof...(Errors) > 0, "RetryOn needs at least one exception type");
    return [](const std::exception_ptr& error) { return error != nullptr && detail::MatchesAnyOf<Errors...>(error); };
}

// Matches anything derived from std::exception.
ErrorPredicate RetryOnStandardErrors();

// Matches NonRetryableException.
ErrorPredicate NonRetryableErrors();

// Matches nothing.
ErrorPredicate NoErrors();

/**
 * @return what() of a std::exception, or a placeholder for other error types
 */
std::string DescribeError(const std::exception_ptr& error);

} // namespace retryable

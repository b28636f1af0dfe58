#pragma once

#include "common/option.h"
#include "retryable/retry_config.h"

namespace retryable {

/**
 * Builds a retry config from an options bag. Only the retry keys present in
 * options override the matching fields of base; the rest of base is kept.
 *
 * @throws std::invalid_argument on malformed values
 */
RetryConfig LoadRetryConfig(const Options& options, RetryConfig base = DefaultRetryConfig());

} // namespace retryable

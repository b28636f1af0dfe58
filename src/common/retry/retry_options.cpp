#include "common/retry/retry_options.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace retryable {

namespace {

bool HasOption(const Options& options, const std::string& name) {
    return options.find(name) != options.end();
}

// Delays must be finite, a nan or inf delay never makes a usable sleep.
double GetDelaySeconds(const Options& options, const std::string& name) {
    auto seconds = GetOptionValue<double>(options, name);
    if (!std::isfinite(seconds)) {
        throw std::invalid_argument("Invalid value for " + name + ": " + options.at(name));
    }
    return seconds;
}

} // namespace

RetryConfig LoadRetryConfig(const Options& options, RetryConfig base) {
    RetryConfig::Builder builder(std::move(base));

    if (HasOption(options, RETRYABLE_MAX_ATTEMPTS)) {
        builder.WithMaxAttempts(GetOptionValue<int>(options, RETRYABLE_MAX_ATTEMPTS));
    }
    if (HasOption(options, RETRYABLE_BASE_DELAY_SEC)) {
        builder.WithBaseDelay(Seconds(GetDelaySeconds(options, RETRYABLE_BASE_DELAY_SEC)));
    }
    if (HasOption(options, RETRYABLE_BACKOFF)) {
        builder.WithBackoff(ParseBackoffStrategy(GetOptionValue<std::string>(options, RETRYABLE_BACKOFF)));
    }
    if (HasOption(options, RETRYABLE_JITTER)) {
        builder.WithJitter(GetOptionValue<bool>(options, RETRYABLE_JITTER));
    }
    if (HasOption(options, RETRYABLE_MAX_DELAY_SEC)) {
        auto max_delay_sec = GetDelaySeconds(options, RETRYABLE_MAX_DELAY_SEC);
        if (max_delay_sec > 0.0) {
            builder.WithMaxDelay(Seconds(max_delay_sec));
        } else {
            builder.WithoutMaxDelay();
        }
    }

    RetryConfig config = builder.Build();
    SPDLOG_INFO("Load retry config from options: {}", config.ToString());
    return config;
}

} // namespace retryable

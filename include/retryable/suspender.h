#pragma once

#include <chrono>

namespace retryable {

/**
 * Pauses the current retry loop between two attempts.
 */
class Suspender {
 public:
    virtual ~Suspender() = default;

    virtual void Suspend(std::chrono::nanoseconds duration) = 0;
};

/**
 * Blocks the calling thread only.
 */
class ThreadSuspender : public Suspender {
 public:
    void Suspend(std::chrono::nanoseconds duration) override;
};

} // namespace retryable

#include "retryable/suspender.h"

#include <thread>

namespace retryable {

void ThreadSuspender::Suspend(std::chrono::nanoseconds duration) {
    if (duration > std::chrono::nanoseconds(0)) {
        std::this_thread::sleep_for(duration);
    }
}

} // namespace retryable

#include "retryable/asio_suspender.h"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace retryable {

YieldSuspender::YieldSuspender(boost::asio::io_context& io_context, boost::asio::yield_context yield)
    : io_context_(io_context),
      yield_(std::move(yield)) {
}

void YieldSuspender::Suspend(std::chrono::nanoseconds duration) {
    if (duration <= std::chrono::nanoseconds(0)) {
        // still give the other coroutines a turn
        boost::asio::post(io_context_, yield_);
        return;
    }
    boost::asio::steady_timer timer(io_context_);
    timer.expires_after(duration);
    timer.async_wait(yield_);
}

} // namespace retryable

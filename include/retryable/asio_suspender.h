#pragma once

#include <chrono>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "retryable/suspender.h"

namespace retryable {

/**
 * Suspends a stackful coroutine started with boost::asio::spawn. While the
 * coroutine waits, the io_context keeps running other handlers and
 * coroutines, even on a single thread.
 *
 * Must only be used from inside the coroutine owning the yield context.
 */
class YieldSuspender : public Suspender {
 public:
    YieldSuspender(boost::asio::io_context& io_context, boost::asio::yield_context yield);

    /**
     * @throws boost::system::system_error if the timer wait fails
     */
    void Suspend(std::chrono::nanoseconds duration) override;

 private:
    boost::asio::io_context& io_context_;
    boost::asio::yield_context yield_;
};

} // namespace retryable

#pragma once
#include "ddplink/net/NetConfig.hpp"

#include <chrono>

/**
 * @brief Run an async operation with a deadline, driving the io_context on the caller's thread.
 *
 * Pattern:
 * - Start an async operation, then run the owning `asio::io_context` for at most
 *   `timeout`. No background thread is involved, so a receive behaves like a
 *   blocking call with a timeout.
 * - If the deadline passes first, `cancel()` aborts the operation and the
 *   context is run once more so the aborted handler completes before return.
 *
 * Notes:
 * - A completion that was already queued when the deadline expired still wins;
 *   cancellation only affects operations that are genuinely pending.
 * - The `cancel()` functor must cancel the socket that launched the operation.
 * - The io_context must not be run concurrently from another thread.
 */
namespace ddplink::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::io_context& io,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    bool done = false;
    std::error_code result = asio::error::would_block;

    auto op_handler = [&done, &result](const std::error_code& op_ec) {
        result = op_ec;
        done = true;
    };

    start_async(op_handler);

    io.restart();
    io.run_for(timeout.count() < 0 ? std::chrono::milliseconds::zero() : timeout);
    if (done) {
        return result;
    }

    cancel();
    io.restart();
    io.run();

    if (!done || result == asio::error::operation_aborted) {
        return asio::error::timed_out;
    }
    return result;
}

} // namespace ddplink::net

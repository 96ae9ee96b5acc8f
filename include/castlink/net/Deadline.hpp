#pragma once
#include "castlink/net/NetConfig.hpp"
#include "castlink/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

namespace castlink::net {

/**
 * @brief Block the caller on one async operation, bounded by a steady_timer.
 *
 * `start_async(handler)` must launch exactly one operation that eventually
 * calls `handler(error_code, ...)`. The first of operation and timer to finish
 * decides the result; on timeout `cancel()` runs and `asio::error::timed_out`
 * is returned.
 *
 * - Shared state is held by `shared_ptr`, so late handlers are harmless.
 * - `cancel()` runs on `ex`. Pass the stream's strand so it is serialised
 *   with the operation it cancels.
 * - After a timeout the operation is still outstanding: whatever it touches
 *   must be captured by value.
 * - Never call this from the io_context's own thread; it would wait forever.
 *
 * @p what names the operation in the timeout trace. Callers report the
 * failure themselves, so the trace is Debug only.
 */
template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    const char* what,
    StartAsync start_async,
    Cancel cancel)
{
    struct Outcome {
        std::mutex m;
        std::condition_variable cv;
        bool settled = false;
        std::error_code ec;
    };

    auto outcome = std::make_shared<Outcome>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto settle = [outcome](const std::error_code& ec) {
        std::lock_guard<std::mutex> lk(outcome->m);
        if (outcome->settled) {
            return false;
        }
        outcome->ec = ec;
        outcome->settled = true;
        outcome->cv.notify_one();
        return true;
    };

    start_async([settle, timer](const std::error_code& op_ec, auto&&...) {
        if (settle(op_ec)) {
            timer->cancel();
        }
    });

    timer->expires_after(timeout);
    timer->async_wait([settle, cancel, what, timeout](const std::error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            return;
        }
        if (settle(asio::error::timed_out)) {
            logDebug("[with_deadline] ", what, " timed out after ", timeout.count(), "ms\n");
            cancel();
        }
    });

    std::unique_lock<std::mutex> lk(outcome->m);
    outcome->cv.wait(lk, [&]{ return outcome->settled; });
    return outcome->ec;
}

} // namespace castlink::net

#pragma once
#include "castlink/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace castlink::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All socket and timer completions of every receiver connection run on this
 * loop. Callers block on those operations through `with_deadline`, so the loop
 * must stay free of blocking work of its own.
 *
 * Lifetime notes:
 * - Destroy devices before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 * - An exception escaping a handler is logged and the loop resumes.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    void run();

    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// Process-wide loop shared by every `TlsClient`.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace castlink::net

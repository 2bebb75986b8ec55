#pragma once
#include "tvdeck/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace tvdeck::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Orchestrator callers are ordinary blocking threads (a CLI invocation, a
 * worker of the embedding service). Their socket work is started as async operations on this
 * loop and awaited through `with_deadline`, so a slow device only ever blocks
 * the caller that addressed it, never the loop and never other devices.
 *
 * Lifetime notes:
 * - Destroy transports before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 *
 * `shared_io_context()` returns the process-wide instance.
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
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace tvdeck::net

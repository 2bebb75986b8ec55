#pragma once

#include "tvdeck/core/Device.hpp"
#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/Command.hpp"

#include <chrono>
#include <memory>

namespace tvdeck::tv {

/**
 * @brief An established control link to one device.
 *
 * Implementations report failures as classified `core::Error`s: Connection
 * for link-level trouble, Timeout when the command bound elapsed, Rejected
 * when the device answered but refused. `execute` must honour
 * `command.timeout()`.
 *
 * A connection is held exclusively by `ConnectionManager`; the orchestrator
 * guarantees at most one caller uses it at a time.
 */
class DeviceConnection {
public:
    virtual ~DeviceConnection() = default;

    virtual const core::Device& device() const = 0;

    /// Lightweight liveness check beyond "socket open".
    virtual expected<void> probe(std::chrono::milliseconds timeout) = 0;

    virtual CommandResult execute(const Command& command) = 0;

    /// Tear down the link. Idempotent.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

/**
 * @brief Factory for device connections (the device-transport boundary).
 */
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual expected<std::shared_ptr<DeviceConnection>>
    open(const core::Device& device, std::chrono::milliseconds timeout) = 0;
};

} // namespace tvdeck::tv

#pragma once
#include "tvdeck/core/Expected.hpp"
#include "tvdeck/adb/AdbConfig.hpp"
#include "tvdeck/adb/AdbRequest.hpp"
#include "tvdeck/net/TcpClient.hpp"
#include "tvdeck/tv/DeviceTransport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::adb {

using tvdeck::expected;

/// Where the local ADB server listens.
struct AdbServerEndpoint {
    std::string host = config::ADB_SERVER_HOST_DEFAULT;
    unsigned short port = config::ADB_SERVER_PORT_DEFAULT;

    std::string describe() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Control link to one device, spoken through the ADB server.
 *
 * The smart-socket protocol dedicates one TCP stream to each service, so
 * every command opens a fresh socket to the server, switches it to the
 * device's transport, then runs `shell:` or `exec:` and drains the output
 * until the server closes the stream. The device-level link (`host:connect`)
 * persists across commands until `close()`.
 *
 * Error mapping:
 * - socket timeout            -> Timeout
 * - other socket errors       -> Connection
 * - FAIL naming a dead link   -> Connection
 * - any other FAIL            -> Rejected
 */
class AdbConnection : public tv::DeviceConnection {
public:
    AdbConnection(core::Device device, AdbServerEndpoint server);
    ~AdbConnection() override;

    AdbConnection(const AdbConnection&) = delete;
    AdbConnection& operator=(const AdbConnection&) = delete;

    /// Ask the server to attach the device (`host:connect`).
    expected<void> connect(std::chrono::milliseconds timeout);

    const core::Device& device() const override { return device_; }
    expected<void> probe(std::chrono::milliseconds timeout) override;
    tv::CommandResult execute(const tv::Command& command) override;
    void close() override;                      // idempotent
    bool isOpen() const override { return open_.load(); }

private:
    using clock = std::chrono::steady_clock;

    /// Host service with a length-prefixed text reply.
    expected<std::string> hostQuery(const AdbRequest& request, clock::time_point deadline);

    /// Device service whose output runs until the server closes the stream.
    expected<std::vector<std::uint8_t>> runService(const AdbRequest& service, clock::time_point deadline);

    expected<void> openSocket(net::TcpClient& client, clock::time_point deadline);
    expected<void> sendRequest(net::TcpClient& client, const AdbRequest& request, clock::time_point deadline);
    expected<void> expectOkay(net::TcpClient& client, const AdbRequest& request, clock::time_point deadline);
    expected<std::string> readLengthPrefixed(net::TcpClient& client, clock::time_point deadline);

    core::Error socketError(const std::error_code& ec, std::string_view where) const;
    static std::chrono::milliseconds remaining(clock::time_point deadline);

    core::Device device_;
    AdbServerEndpoint server_;
    std::atomic<bool> open_{false};
};

/**
 * @brief `DeviceTransport` backed by the ADB server.
 */
class AdbTransport : public tv::DeviceTransport {
public:
    explicit AdbTransport(AdbServerEndpoint server = {});

    expected<std::shared_ptr<tv::DeviceConnection>>
    open(const core::Device& device, std::chrono::milliseconds timeout) override;

    const AdbServerEndpoint& server() const { return server_; }

private:
    AdbServerEndpoint server_;
};

} // namespace tvdeck::adb

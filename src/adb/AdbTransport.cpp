/**
 * @brief ADB server client: link setup, liveness probing, and command streams.
 */
#include "tvdeck/adb/AdbTransport.hpp"

#include "tvdeck/adb/AdbResponse.hpp"
#include "tvdeck/net/Resolve.hpp"
#include "tvdeck/tv/TvConfig.hpp"
#include "tvdeck/log/Log.hpp"

#include <array>
#include <system_error>

namespace tvdeck::adb {

using core::ErrorKind;
namespace asio = tvdeck::net::asio;

AdbConnection::AdbConnection(core::Device device, AdbServerEndpoint server)
: device_(std::move(device))
, server_(std::move(server))
{}

AdbConnection::~AdbConnection() {
    close();
}

std::chrono::milliseconds AdbConnection::remaining(clock::time_point deadline) {
    const auto now = clock::now();
    if (now >= deadline) {
        return std::chrono::milliseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

core::Error AdbConnection::socketError(const std::error_code& ec, std::string_view where) const {
    const auto kind = (ec == asio::error::timed_out) ? ErrorKind::Timeout : ErrorKind::Connection;
    core::Error err(kind, std::string(where) + " via adb server " + server_.describe(), ec);
    err.deviceId = device_.id;
    return err;
}

expected<void> AdbConnection::openSocket(net::TcpClient& client, clock::time_point deadline) {
    const auto budget = remaining(deadline);
    if (budget.count() == 0) {
        return unexpected(socketError(asio::error::timed_out, "connect"));
    }

    std::error_code ec;
    const auto address = asio::ip::make_address(server_.host, ec);
    if (!ec) {
        ec = client.connect(net::tcp::endpoint(address, server_.port), budget);
    } else {
        net::tcp::resolver::results_type results;
        ec = net::resolve(net::io_context(), server_.host, std::to_string(server_.port), results);
        if (!ec) {
            ec = client.connect(results, budget);
        }
    }

    if (ec) {
        logDebug("[AdbConnection] server connect failed: ", ec.message(),
                 " (", server_.describe(), ")\n");
        return unexpected(socketError(ec, "connect"));
    }
    client.setLowLatency();
    return {};
}

expected<void> AdbConnection::sendRequest(net::TcpClient& client, const AdbRequest& request,
                                          clock::time_point deadline) {
    if (!request.isReady()) {
        core::Error err(ErrorKind::Rejected, "request too long or empty");
        err.deviceId = device_.id;
        err.command = request.serviceName();
        return unexpected(std::move(err));
    }
    if (auto ec = client.write_all(request.data(), request.size(), remaining(deadline)); ec) {
        return unexpected(socketError(ec, "send '" + request.serviceName() + "'"));
    }
    return {};
}

expected<std::string> AdbConnection::readLengthPrefixed(net::TcpClient& client,
                                                        clock::time_point deadline) {
    std::array<std::uint8_t, config::ADB_LENGTH_PREFIX_SIZE> prefix{};
    if (auto ec = client.read_exact(prefix.data(), prefix.size(), remaining(deadline)); ec) {
        return unexpected(socketError(ec, "read length"));
    }
    const auto length = AdbResponse::decodeLength(prefix.data(), prefix.size());
    if (!length || *length > config::ADB_MAX_MESSAGE_SIZE) {
        logError("[AdbConnection] bad length prefix: ",
                 AdbResponse::toHexLine(prefix.data(), prefix.size()), "\n");
        return unexpected(socketError(std::make_error_code(std::errc::protocol_error), "decode length"));
    }
    std::string message(*length, '\0');
    if (*length > 0) {
        if (auto ec = client.read_exact(message.data(), message.size(), remaining(deadline)); ec) {
            return unexpected(socketError(ec, "read message"));
        }
    }
    return message;
}

expected<void> AdbConnection::expectOkay(net::TcpClient& client, const AdbRequest& request,
                                         clock::time_point deadline) {
    std::array<std::uint8_t, config::ADB_STATUS_SIZE> raw{};
    if (auto ec = client.read_exact(raw.data(), raw.size(), remaining(deadline)); ec) {
        return unexpected(socketError(ec, "status for '" + request.serviceName() + "'"));
    }

    const auto status = AdbResponse::decodeStatus(raw.data(), raw.size());
    if (status == AdbStatus::Okay) {
        return {};
    }

    if (status == AdbStatus::Invalid) {
        logError("[AdbConnection] unexpected status for '", request.serviceName(), "'\n",
                 "           hex: ", AdbResponse::toHexLine(raw.data(), raw.size()), '\n');
        return unexpected(socketError(std::make_error_code(std::errc::protocol_error), "decode status"));
    }

    auto message = readLengthPrefixed(client, deadline);
    const std::string reason = message ? *message : std::string("(no reason given)");
    const auto kind = AdbResponse::isLinkFailure(reason) ? ErrorKind::Connection : ErrorKind::Rejected;

    logDebug("[AdbConnection] FAIL for '", request.serviceName(), "': ", reason, "\n");

    core::Error err(kind, reason);
    err.deviceId = device_.id;
    err.command = request.serviceName();
    return unexpected(std::move(err));
}

expected<std::string> AdbConnection::hostQuery(const AdbRequest& request, clock::time_point deadline) {
    net::TcpClient client;
    if (auto opened = openSocket(client, deadline); !opened) {
        return unexpected(opened.error());
    }
    if (auto sent = sendRequest(client, request, deadline); !sent) {
        return unexpected(sent.error());
    }
    if (auto okay = expectOkay(client, request, deadline); !okay) {
        return unexpected(okay.error());
    }
    return readLengthPrefixed(client, deadline);
}

expected<std::vector<std::uint8_t>>
AdbConnection::runService(const AdbRequest& service, clock::time_point deadline) {
    net::TcpClient client;
    if (auto opened = openSocket(client, deadline); !opened) {
        return unexpected(opened.error());
    }

    const auto transport = AdbRequest::transport(device_.serial());
    if (auto sent = sendRequest(client, transport, deadline); !sent) {
        return unexpected(sent.error());
    }
    if (auto okay = expectOkay(client, transport, deadline); !okay) {
        return unexpected(okay.error());
    }

    if (auto sent = sendRequest(client, service, deadline); !sent) {
        return unexpected(sent.error());
    }
    if (auto okay = expectOkay(client, service, deadline); !okay) {
        return unexpected(okay.error());
    }

    std::vector<std::uint8_t> output;
    if (auto ec = client.read_to_end(output, remaining(deadline), config::ADB_MAX_STREAM_BYTES); ec) {
        return unexpected(socketError(ec, "read output of '" + service.serviceName() + "'"));
    }
    return output;
}

expected<void> AdbConnection::connect(std::chrono::milliseconds timeout) {
    const auto deadline = clock::now() + timeout;
    auto reply = hostQuery(AdbRequest::connect(device_.serial()), deadline);
    if (!reply) {
        logError("[AdbConnection] connect ", device_.serial(), " failed: ",
                 reply.error().describe(), "\n");
        return unexpected(reply.error());
    }

    if (!AdbResponse::isConnectSuccess(*reply)) {
        core::Error err(ErrorKind::Connection, *reply);
        err.deviceId = device_.id;
        err.command = "host:connect:" + device_.serial();
        logError("[AdbConnection] connect ", device_.serial(), " refused: ", *reply, "\n");
        return unexpected(std::move(err));
    }

    open_ = true;
    logInfo("[AdbConnection] ", device_.id, " linked (", *reply, ")\n");
    return {};
}

expected<void> AdbConnection::probe(std::chrono::milliseconds timeout) {
    const auto deadline = clock::now() + timeout;
    auto state = hostQuery(AdbRequest::getState(device_.serial()), deadline);
    if (!state) {
        return unexpected(state.error());
    }
    if (*state != "device") {
        // "offline", "unauthorized", "bootloader", ...
        core::Error err(ErrorKind::Connection, "device state is '" + *state + "'");
        err.deviceId = device_.id;
        err.command = "get-state";
        return unexpected(std::move(err));
    }
    return {};
}

tv::CommandResult AdbConnection::execute(const tv::Command& command) {
    if (!open_) {
        core::Error err(ErrorKind::Connection, "link closed",
                        std::make_error_code(std::errc::not_connected));
        err.deviceId = device_.id;
        err.command = command.describe();
        return unexpected(std::move(err));
    }

    const auto deadline = clock::now() + command.timeout();
    const auto service = command.kind() == tv::CommandKind::ScreenCapture
        ? AdbRequest::exec(command.shellLine())
        : AdbRequest::shell(command.shellLine());

    logDebug("[AdbConnection] TX ", device_.id, " '", service.serviceName(),
             "' (timeout ", command.timeout().count(), "ms)\n");

    auto output = runService(service, deadline);
    if (!output) {
        auto err = output.error();
        err.withContext(device_.id, command.describe());
        return unexpected(std::move(err));
    }

    logDebug("[AdbConnection] RX ", device_.id, " ", output->size(), " bytes\n");
    return tv::CommandOutput{std::move(*output)};
}

void AdbConnection::close() {
    if (!open_.exchange(false)) {
        return;
    }
    logInfo("[AdbConnection] close() ", device_.id, "\n");
    const auto deadline = clock::now() + tv::config::PROBE_TIMEOUT;
    if (auto reply = hostQuery(AdbRequest::disconnect(device_.serial()), deadline); !reply) {
        logWarning("[AdbConnection] disconnect ", device_.serial(), " failed: ",
                   reply.error().describe(), "\n");
    }
}

AdbTransport::AdbTransport(AdbServerEndpoint server)
: server_(std::move(server))
{
    net::ensureNetService();
}

expected<std::shared_ptr<tv::DeviceConnection>>
AdbTransport::open(const core::Device& device, std::chrono::milliseconds timeout) {
    auto connection = std::make_shared<AdbConnection>(device, server_);
    if (auto linked = connection->connect(timeout); !linked) {
        return unexpected(linked.error());
    }
    return std::shared_ptr<tv::DeviceConnection>(std::move(connection));
}

} // namespace tvdeck::adb

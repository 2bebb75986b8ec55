#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace tvdeck::core {

/**
 * @brief Classification of every failure the control layer can report.
 *
 * Connection and Timeout are connection-level: the orchestrator reconnects
 * and retries them. Everything else is surfaced to the caller immediately.
 */
enum class ErrorKind {
    Connection,      ///< Device unreachable, link rejected, or liveness probe failed.
    Timeout,         ///< A command exceeded its deadline.
    Rejected,        ///< Device reachable but refused or could not run the command.
    Resolution,      ///< No launch intent could be built for the requested app.
    Busy,            ///< A conflicting operation holds the device.
    Cancelled,       ///< The caller cancelled before the next command boundary.
    InvalidArgument, ///< Unknown direction, action, or malformed argument.
    UnknownDevice    ///< Device id is not in the configured set.
};

struct Error {
    ErrorKind kind = ErrorKind::Connection;
    std::string deviceId;
    std::string command;
    std::string message;
    std::error_code cause{};

    Error() = default;
    Error(ErrorKind k, std::string msg, std::error_code ec = {})
    : kind(k), message(std::move(msg)), cause(ec) {}

    /// True for failures that warrant reconnect-then-retry.
    bool isConnectionLevel() const {
        return kind == ErrorKind::Connection || kind == ErrorKind::Timeout;
    }

    /// Fill in device and command context when the producer did not know it.
    Error& withContext(const std::string& device, const std::string& attempted);

    static const char* toString(ErrorKind kind);
    std::string describe() const;

    /// Short advice that differs for unreachable, unsupported, and busy.
    std::string userHint() const;
};

} // namespace tvdeck::core

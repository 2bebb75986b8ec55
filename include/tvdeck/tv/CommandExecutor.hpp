#pragma once

#include "tvdeck/tv/Command.hpp"
#include "tvdeck/tv/DeviceTransport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::tv {

/**
 * @brief Issues one command on an established connection and classifies the outcome.
 *
 * The deadline is enforced by the connection (`Command::timeout()`); a
 * timeout comes back as a `Timeout` failure, never as an exception.
 * Successful transport output is inspected as well: `am`, `monkey` and
 * `input` report refusals on stdout with a zero exit, so known refusal
 * markers are turned into `Rejected`. Screen captures that are not PNG
 * (secure video surfaces return nothing) are `Rejected` too.
 */
class CommandExecutor {
public:
    CommandResult run(DeviceConnection& connection, const Command& command) const;

    /// First line of @p output that signals the device refused the command.
    static std::optional<std::string> findRejection(std::string_view output);

    static bool isPng(const std::vector<std::uint8_t>& bytes);
};

} // namespace tvdeck::tv

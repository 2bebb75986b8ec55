#include "tvdeck/tv/CommandExecutor.hpp"
#include "tvdeck/log/Log.hpp"

#include <algorithm>
#include <array>
#include <chrono>

namespace tvdeck::tv {

using core::ErrorKind;

namespace {

constexpr std::array<std::uint8_t, 8> PNG_SIGNATURE{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

// Matched at the start of a trimmed line.
constexpr std::array<std::string_view, 5> LINE_PREFIX_MARKERS{
    "Error:",
    "Error type",
    "Exception occurred",
    "Unknown command",
    "** No activities found",
};

// Matched anywhere in the output.
constexpr std::array<std::string_view, 4> ANYWHERE_MARKERS{
    "java.lang.SecurityException",
    "Bad component name",
    "inaccessible or not found",
    ": not found",
};

std::string_view trim(std::string_view line) {
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) line.remove_prefix(1);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.remove_suffix(1);
    return line;
}

} // namespace

std::optional<std::string> CommandExecutor::findRejection(std::string_view output) {
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        const auto line = trim(output.substr(start, end - start));
        for (auto marker : LINE_PREFIX_MARKERS) {
            if (line.substr(0, marker.size()) == marker) {
                return std::string(line);
            }
        }
        for (auto marker : ANYWHERE_MARKERS) {
            if (line.find(marker) != std::string_view::npos) {
                return std::string(line);
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

bool CommandExecutor::isPng(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < PNG_SIGNATURE.size()) return false;
    return std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), bytes.begin());
}

CommandResult CommandExecutor::run(DeviceConnection& connection, const Command& command) const {
    const auto& deviceId = connection.device().id;
    const auto started = std::chrono::steady_clock::now();

    logDebug("[CommandExecutor] ", deviceId, " TX ", command.describe(), "\n");

    auto result = connection.execute(command);

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (!result) {
        auto err = result.error();
        err.withContext(deviceId, command.describe());
        logError("[CommandExecutor] ", err.describe(), " after ", elapsedMs, "ms\n");
        return unexpected(std::move(err));
    }

    if (command.kind() == CommandKind::ScreenCapture) {
        if (!isPng(result->bytes)) {
            core::Error err(ErrorKind::Rejected,
                            "capture returned " + std::to_string(result->bytes.size()) +
                            " bytes without a PNG header (secure video surfaces block capture)");
            err.withContext(deviceId, command.describe());
            logError("[CommandExecutor] ", err.describe(), "\n");
            return unexpected(std::move(err));
        }
    } else if (auto refusal = findRejection(result->text())) {
        core::Error err(ErrorKind::Rejected, *refusal);
        err.withContext(deviceId, command.describe());
        logError("[CommandExecutor] ", err.describe(), "\n");
        return unexpected(std::move(err));
    }

    logDebug("[CommandExecutor] ", deviceId, " RX ", result->bytes.size(), " bytes in ",
             elapsedMs, "ms\n");
    return result;
}

} // namespace tvdeck::tv

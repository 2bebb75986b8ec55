#pragma once

#include "tvdeck/core/Expected.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tvdeck::tv {

struct KeyEvent {
    std::string keycode;    ///< Android key name, e.g. "KEYCODE_DPAD_UP".
};

struct ShellCommand {
    std::string commandLine;
};

struct TextInput {
    std::string text;       ///< Unescaped text as the user typed it.
};

struct ScreenCapture {};

enum class CommandKind : std::uint8_t {
    KeyEvent,
    Shell,
    TextInput,
    ScreenCapture
};

/**
 * @brief One atomic request to a device, with its own deadline.
 *
 * Construct through the named factories so each kind gets its default bound.
 */
class Command {
public:
    using Payload = std::variant<KeyEvent, ShellCommand, TextInput, ScreenCapture>;

    static Command keyEvent(std::string keycode);
    static Command shell(std::string commandLine);
    static Command textInput(std::string text);
    static Command screenCapture();

    Command& withTimeout(std::chrono::milliseconds bound);

    CommandKind kind() const;
    const Payload& payload() const { return payload_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Device-side shell line for key, shell and text commands.
     *
     * Screen capture has no shell form (it is a raw exec stream) and returns
     * "screencap -p".
     */
    std::string shellLine() const;

    /// Human-readable form used in logs and error context.
    std::string describe() const;

    /// Escape text for `input text`: spaces become %s, shell metacharacters are backslashed.
    static std::string escapeInputText(std::string_view text);

    /// Wrap one shell argument in single quotes; embedded quotes become '\''.
    static std::string quoteArgument(std::string_view text);

    static const char* toString(CommandKind kind);

private:
    Command(Payload payload, std::chrono::milliseconds timeout)
    : payload_(std::move(payload)), timeout_(timeout) {}

    Payload payload_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Raw success payload of a command: shell text or capture bytes.
 */
struct CommandOutput {
    std::vector<std::uint8_t> bytes;

    std::string text() const { return std::string(bytes.begin(), bytes.end()); }
    bool empty() const { return bytes.empty(); }

    static CommandOutput fromText(std::string_view text) {
        return CommandOutput{std::vector<std::uint8_t>(text.begin(), text.end())};
    }
};

/// Immutable outcome of a Command: output or a classified failure.
using CommandResult = expected<CommandOutput>;

} // namespace tvdeck::tv

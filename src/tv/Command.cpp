#include "tvdeck/tv/Command.hpp"
#include "tvdeck/tv/TvConfig.hpp"

#include <cstring>

namespace tvdeck::tv {

namespace {
// Characters `sh -c` would otherwise interpret inside `input text`.
constexpr const char* SHELL_SPECIALS = "\\'\"`$&|;<>()[]{}*?!#~";

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

Command Command::keyEvent(std::string keycode) {
    return Command(KeyEvent{std::move(keycode)}, config::KEY_EVENT_TIMEOUT);
}

Command Command::shell(std::string commandLine) {
    return Command(ShellCommand{std::move(commandLine)}, config::SHELL_TIMEOUT);
}

Command Command::textInput(std::string text) {
    return Command(TextInput{std::move(text)}, config::TEXT_INPUT_TIMEOUT);
}

Command Command::screenCapture() {
    return Command(ScreenCapture{}, config::SCREEN_CAPTURE_TIMEOUT);
}

Command& Command::withTimeout(std::chrono::milliseconds bound) {
    timeout_ = bound.count() < 0 ? std::chrono::milliseconds::zero() : bound;
    return *this;
}

CommandKind Command::kind() const {
    return std::visit(overloaded{
        [](const KeyEvent&)      { return CommandKind::KeyEvent; },
        [](const ShellCommand&)  { return CommandKind::Shell; },
        [](const TextInput&)     { return CommandKind::TextInput; },
        [](const ScreenCapture&) { return CommandKind::ScreenCapture; },
    }, payload_);
}

std::string Command::shellLine() const {
    return std::visit(overloaded{
        [](const KeyEvent& k)      { return "input keyevent " + k.keycode; },
        [](const ShellCommand& s)  { return s.commandLine; },
        [](const TextInput& t)     { return "input text " + escapeInputText(t.text); },
        [](const ScreenCapture&)   { return std::string("screencap -p"); },
    }, payload_);
}

std::string Command::describe() const {
    return std::string(toString(kind())) + ": " + shellLine();
}

std::string Command::escapeInputText(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            // A raw line break would end the `input text` command inside `sh -c`.
            out += "%s";
        } else if (u < 0x20 || u == 0x7f) {
            continue;
        } else if (std::strchr(SHELL_SPECIALS, c) != nullptr) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

std::string Command::quoteArgument(std::string_view text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

const char* Command::toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::KeyEvent:      return "key";
        case CommandKind::Shell:         return "shell";
        case CommandKind::TextInput:     return "text";
        case CommandKind::ScreenCapture: return "capture";
    }
    return "unknown";
}

} // namespace tvdeck::tv

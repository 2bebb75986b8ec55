#include "tvdeck/tv/KeyCodes.hpp"

#include "tvdeck/tv/Url.hpp"

#include <string>

namespace tvdeck::tv {

std::optional<Direction> parseDirection(std::string_view text) {
    const std::string name = toLower(trimView(text));
    if (name == "up") return Direction::Up;
    if (name == "down") return Direction::Down;
    if (name == "left") return Direction::Left;
    if (name == "right") return Direction::Right;
    if (name == "select" || name == "enter" || name == "ok") return Direction::Select;
    if (name == "back") return Direction::Back;
    if (name == "home") return Direction::Home;
    return std::nullopt;
}

std::optional<VolumeAction> parseVolumeAction(std::string_view text) {
    const std::string name = toLower(trimView(text));
    if (name == "up") return VolumeAction::Up;
    if (name == "down") return VolumeAction::Down;
    if (name == "mute") return VolumeAction::Mute;
    return std::nullopt;
}

const char* keycodeFor(Direction direction) {
    switch (direction) {
        case Direction::Up: return keycode::DPAD_UP;
        case Direction::Down: return keycode::DPAD_DOWN;
        case Direction::Left: return keycode::DPAD_LEFT;
        case Direction::Right: return keycode::DPAD_RIGHT;
        case Direction::Select: return keycode::DPAD_CENTER;
        case Direction::Back: return keycode::BACK;
        case Direction::Home: return keycode::HOME;
    }
    return keycode::DPAD_CENTER;
}

const char* keycodeFor(VolumeAction action) {
    switch (action) {
        case VolumeAction::Up: return keycode::VOLUME_UP;
        case VolumeAction::Down: return keycode::VOLUME_DOWN;
        case VolumeAction::Mute: return keycode::VOLUME_MUTE;
    }
    return keycode::VOLUME_MUTE;
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
        case Direction::Select: return "select";
        case Direction::Back: return "back";
        case Direction::Home: return "home";
    }
    return "unknown";
}

const char* toString(VolumeAction action) {
    switch (action) {
        case VolumeAction::Up: return "up";
        case VolumeAction::Down: return "down";
        case VolumeAction::Mute: return "mute";
    }
    return "unknown";
}

} // namespace tvdeck::tv

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tvdeck::tv {

namespace keycode {
inline constexpr const char* DPAD_UP = "KEYCODE_DPAD_UP";
inline constexpr const char* DPAD_DOWN = "KEYCODE_DPAD_DOWN";
inline constexpr const char* DPAD_LEFT = "KEYCODE_DPAD_LEFT";
inline constexpr const char* DPAD_RIGHT = "KEYCODE_DPAD_RIGHT";
inline constexpr const char* DPAD_CENTER = "KEYCODE_DPAD_CENTER";
inline constexpr const char* BACK = "KEYCODE_BACK";
inline constexpr const char* HOME = "KEYCODE_HOME";
inline constexpr const char* VOLUME_UP = "KEYCODE_VOLUME_UP";
inline constexpr const char* VOLUME_DOWN = "KEYCODE_VOLUME_DOWN";
inline constexpr const char* VOLUME_MUTE = "KEYCODE_VOLUME_MUTE";
inline constexpr const char* WAKEUP = "KEYCODE_WAKEUP";
inline constexpr const char* SLEEP = "KEYCODE_SLEEP";
inline constexpr const char* POWER = "KEYCODE_POWER";
inline constexpr const char* MEDIA_PLAY_PAUSE = "KEYCODE_MEDIA_PLAY_PAUSE";
inline constexpr const char* SEARCH = "KEYCODE_SEARCH";
inline constexpr const char* ENTER = "KEYCODE_ENTER";
} // namespace keycode

enum class Direction : std::uint8_t { Up, Down, Left, Right, Select, Back, Home };

enum class VolumeAction : std::uint8_t { Up, Down, Mute };

/// Case-insensitive; "enter" and "ok" are accepted as Select.
std::optional<Direction> parseDirection(std::string_view text);
std::optional<VolumeAction> parseVolumeAction(std::string_view text);

const char* keycodeFor(Direction direction);
const char* keycodeFor(VolumeAction action);

const char* toString(Direction direction);
const char* toString(VolumeAction action);

} // namespace tvdeck::tv

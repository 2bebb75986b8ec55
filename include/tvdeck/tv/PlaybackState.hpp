#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tvdeck::tv {

enum class PowerState : std::uint8_t { Unknown, On, Off };

enum class PlaybackPhase : std::uint8_t { Unknown, Playing, Paused, Stopped };

/**
 * @brief Snapshot of a device as reported by one status dump.
 *
 * Every field a dump did not mention stays unknown (Unknown / nullopt).
 * Values are produced fresh per read and never updated in place.
 */
struct PlaybackState {
    PowerState power = PowerState::Unknown;
    bool screensaver = false;                    ///< Awake but dreaming.
    std::optional<std::string> foregroundPackage;
    std::optional<std::string> foregroundActivity;
    std::optional<std::string> context;          ///< "player", "search screen", ...
    PlaybackPhase phase = PlaybackPhase::Unknown;
    std::optional<int> volume;                   ///< Always within 0..100 when set.
    std::optional<bool> muted;
    std::optional<std::string> title;
    std::optional<std::int64_t> positionMs;
    std::chrono::system_clock::time_point observedAt{};

    bool isPlaying() const { return phase == PlaybackPhase::Playing; }

    /// One-line human summary, e.g. "screen on, app com.netflix.ninja (player), playing: Dark".
    std::string summary() const;
};

const char* toString(PowerState power);
const char* toString(PlaybackPhase phase);

/**
 * @brief Turns raw `dumpsys` text into a PlaybackState.
 *
 * Tolerant by contract: unknown lines are skipped, missing sections leave
 * their fields unknown, and no input makes it throw.
 */
class PlaybackStateParser {
public:
    static PlaybackState parse(std::string_view dump) noexcept;
    static PlaybackState parse(std::string_view dump,
                               std::chrono::system_clock::time_point observedAt) noexcept;

    /// Combined shell line whose output parse() understands.
    static const std::string& statusCommand();

    /// Map a PlaybackState.state code to a phase.
    static PlaybackPhase phaseFromCode(int code);

    /// Scale a stream index into 0..100; nullopt when the reading is out of range.
    static std::optional<int> normalizeVolume(long index, std::optional<long> max);

    /// UI context guessed from an activity name; nullopt when nothing matches.
    static std::optional<std::string> inferContext(std::string_view activity);
};

} // namespace tvdeck::tv

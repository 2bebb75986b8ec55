#include "tvdeck/tv/PlaybackState.hpp"

#include "tvdeck/log/Log.hpp"
#include "tvdeck/tv/Url.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <exception>
#include <sstream>
#include <vector>

namespace tvdeck::tv {

namespace {

struct SessionState {
    PlaybackPhase phase = PlaybackPhase::Unknown;
    std::optional<std::int64_t> position;
    std::optional<std::string> title;
};

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

// Integer right after @p key, e.g. numberAfter("state=3, ...", "state=").
std::optional<long> numberAfter(std::string_view line, std::string_view key) {
    const auto pos = line.find(key);
    if (pos == std::string_view::npos) return std::nullopt;
    auto rest = trimView(line.substr(pos + key.size()));
    long value = 0;
    const auto* begin = rest.data();
    const auto* end = rest.data() + rest.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) return std::nullopt;
    return value;
}

std::optional<PowerState> powerFromWakefulness(std::string_view line, bool& dreaming) {
    if (contains(line, "Awake")) return PowerState::On;
    if (contains(line, "Dreaming")) {
        dreaming = true;
        return PowerState::On;
    }
    if (contains(line, "Asleep") || contains(line, "Dozing")) return PowerState::Off;
    return std::nullopt;
}

// "mCurrentFocus=Window{1a2b u0 com.netflix.ninja/com.netflix.ninja.MainActivity}"
std::optional<std::pair<std::string, std::string>> focusComponent(std::string_view line) {
    std::istringstream tokens{std::string(line)};
    std::string token;
    while (tokens >> token) {
        const auto eq = token.find('=');
        if (eq != std::string::npos) token = token.substr(eq + 1);
        while (!token.empty() && (token.front() == '{' || token.front() == '(')) token.erase(0, 1);
        while (!token.empty() && (token.back() == '}' || token.back() == ')' || token.back() == '/')) {
            token.pop_back();
        }
        const auto slash = token.find('/');
        if (slash == std::string::npos || slash == 0 || token.find('.') == std::string::npos) {
            continue;
        }
        return std::make_pair(token.substr(0, slash), token.substr(slash + 1));
    }
    return std::nullopt;
}

// "metadata: size=5, description=Dark, Season 1, Netflix"
std::optional<std::string> descriptionTitle(std::string_view line) {
    const auto pos = line.find("description=");
    if (pos == std::string_view::npos) return std::nullopt;
    auto value = line.substr(pos + 12);
    value = trimView(value.substr(0, value.find(',')));
    if (value.empty() || value == "null") return std::nullopt;
    return std::string(value);
}

// "Current: 2 (speaker): 10, 400 (default): 15" -> 10
std::optional<long> currentIndex(std::string_view line) {
    const auto marker = line.find("): ");
    if (marker != std::string_view::npos) {
        return numberAfter(line.substr(marker), "): ");
    }
    return numberAfter(line, "Current:");
}

std::optional<bool> booleanAfter(std::string_view line, std::string_view key) {
    const auto pos = line.find(key);
    if (pos == std::string_view::npos) return std::nullopt;
    const auto rest = toLower(trimView(line.substr(pos + key.size())));
    if (startsWith(rest, "true")) return true;
    if (startsWith(rest, "false")) return false;
    return std::nullopt;
}

PlaybackState parseLines(std::string_view dump) {
    PlaybackState state;

    std::optional<PowerState> wakefulness;
    std::optional<PowerState> display;
    bool dreaming = false;

    std::optional<std::pair<std::string, std::string>> currentFocus;
    std::optional<std::pair<std::string, std::string>> focusedApp;

    std::vector<SessionState> sessions;
    std::optional<std::string> looseTitle;

    bool inMusicStream = false;
    std::optional<long> musicIndex;
    std::optional<long> musicMax;
    std::optional<long> legacyIndex;

    std::size_t start = 0;
    while (start < dump.size()) {
        auto end = dump.find('\n', start);
        if (end == std::string_view::npos) end = dump.size();
        const auto raw = dump.substr(start, end - start);
        start = end + 1;

        const auto line = trimView(raw);
        if (line.empty()) continue;

        if (startsWith(line, "- STREAM_")) {
            inMusicStream = startsWith(line, "- STREAM_MUSIC");
            continue;
        }
        if (inMusicStream && !raw.empty() && !std::isspace(static_cast<unsigned char>(raw.front()))
            && !startsWith(line, "Max:") && !startsWith(line, "Current:")) {
            inMusicStream = false;
        }

        if (contains(line, "mWakefulness=")) {
            if (auto p = powerFromWakefulness(line, dreaming)) wakefulness = p;
        } else if (contains(line, "Display Power: state=")) {
            if (contains(line, "state=ON")) display = PowerState::On;
            else if (contains(line, "state=OFF")) display = PowerState::Off;
        } else if (contains(line, "mScreenOn=")) {
            if (auto on = booleanAfter(line, "mScreenOn=")) display = *on ? PowerState::On : PowerState::Off;
        } else if (contains(line, "mCurrentFocus")) {
            if (auto f = focusComponent(line)) currentFocus = std::move(f);
        } else if (contains(line, "mFocusedApp")) {
            if (auto f = focusComponent(line)) focusedApp = std::move(f);
        } else if (contains(line, "state=PlaybackState")) {
            SessionState session;
            const auto body = line.substr(line.find("PlaybackState"));
            if (auto code = numberAfter(body, "state=")) {
                session.phase = PlaybackStateParser::phaseFromCode(static_cast<int>(*code));
            }
            if (auto pos = numberAfter(body, "position=")) {
                session.position = *pos;
            }
            sessions.push_back(std::move(session));
        } else if (contains(line, "description=")) {
            auto title = descriptionTitle(line);
            if (title && !sessions.empty() && !sessions.back().title) {
                sessions.back().title = title;
            }
            if (title && !looseTitle) looseTitle = std::move(title);
        } else if (inMusicStream) {
            if (startsWith(line, "Max:")) {
                musicMax = numberAfter(line, "Max:");
            } else if (startsWith(line, "streamVolume:")) {
                musicIndex = numberAfter(line, "streamVolume:");
            } else if (startsWith(line, "Current:") && !musicIndex) {
                musicIndex = currentIndex(line);
            } else if (startsWith(line, "Muted:")) {
                state.muted = booleanAfter(line, "Muted:");
            }
        } else if (contains(line, "STREAM_MUSIC")) {
            if (auto index = numberAfter(line, "index=")) legacyIndex = index;
            else if (auto index2 = numberAfter(line, "index:")) legacyIndex = index2;
            else if (auto vol = numberAfter(line, "volume=")) legacyIndex = vol;
        }

        if (!state.muted) {
            if (contains(line, "muted=true") || contains(line, "muted: true")) state.muted = true;
            else if (contains(line, "muted=false") || contains(line, "muted: false")) state.muted = false;
        }
    }

    state.power = wakefulness ? *wakefulness : display.value_or(PowerState::Unknown);
    state.screensaver = dreaming && state.power == PowerState::On;

    const auto& focus = currentFocus ? currentFocus : focusedApp;
    if (focus) {
        state.foregroundPackage = focus->first;
        state.foregroundActivity = focus->second;
        state.context = PlaybackStateParser::inferContext(focus->second);
    }

    const SessionState* chosen = nullptr;
    for (const auto& session : sessions) {
        if (session.phase == PlaybackPhase::Playing) {
            chosen = &session;
            break;
        }
    }
    if (chosen == nullptr && !sessions.empty()) chosen = &sessions.front();
    if (chosen != nullptr) {
        state.phase = chosen->phase;
        state.positionMs = chosen->position;
        state.title = chosen->title;
    }
    if (!state.title) state.title = looseTitle;

    if (musicIndex) {
        state.volume = PlaybackStateParser::normalizeVolume(*musicIndex, musicMax);
    } else if (legacyIndex) {
        state.volume = PlaybackStateParser::normalizeVolume(*legacyIndex, musicMax);
    }
    return state;
}

} // namespace

const char* toString(PowerState power) {
    switch (power) {
        case PowerState::Unknown: return "unknown";
        case PowerState::On:      return "on";
        case PowerState::Off:     return "off";
    }
    return "unknown";
}

const char* toString(PlaybackPhase phase) {
    switch (phase) {
        case PlaybackPhase::Unknown: return "unknown";
        case PlaybackPhase::Playing: return "playing";
        case PlaybackPhase::Paused:  return "paused";
        case PlaybackPhase::Stopped: return "stopped";
    }
    return "unknown";
}

std::string PlaybackState::summary() const {
    std::ostringstream out;
    out << "screen " << (screensaver ? "screensaver" : toString(power));
    if (foregroundPackage) {
        out << ", app " << *foregroundPackage;
        if (context) out << " (" << *context << ")";
    }
    out << ", " << toString(phase);
    if (title) out << ": " << *title;
    if (volume) out << ", volume " << *volume << "%";
    if (muted && *muted) out << " (muted)";
    return out.str();
}

PlaybackState PlaybackStateParser::parse(std::string_view dump) noexcept {
    return parse(dump, std::chrono::system_clock::now());
}

PlaybackState PlaybackStateParser::parse(std::string_view dump,
                                         std::chrono::system_clock::time_point observedAt) noexcept {
    PlaybackState state;
    try {
        state = parseLines(dump);
    } catch (const std::exception& e) {
        logWarning("[PlaybackStateParser] dump could not be parsed: ", e.what(), "\n");
        state = PlaybackState{};
    }
    state.observedAt = observedAt;
    return state;
}

const std::string& PlaybackStateParser::statusCommand() {
    static const std::string command =
        "dumpsys power | grep -E 'mWakefulness=|Display Power: state='; "
        "dumpsys window windows | grep -E 'mCurrentFocus|mFocusedApp'; "
        "dumpsys media_session | grep -E 'state=PlaybackState|description='; "
        "dumpsys audio | grep -A 8 -E '^- STREAM_MUSIC:'";
    return command;
}

PlaybackPhase PlaybackStateParser::phaseFromCode(int code) {
    switch (code) {
        case 3:     // playing
        case 4:     // fast forwarding
        case 5:     // rewinding
        case 6:     // buffering
            return PlaybackPhase::Playing;
        case 2:
            return PlaybackPhase::Paused;
        case 0:     // none
        case 1:     // stopped
        case 7:     // error
            return PlaybackPhase::Stopped;
        default:
            return PlaybackPhase::Unknown;
    }
}

std::optional<int> PlaybackStateParser::normalizeVolume(long index, std::optional<long> max) {
    if (index < 0) return std::nullopt;
    if (max) {
        if (*max <= 0 || index > *max) return std::nullopt;
        return static_cast<int>(std::lround(static_cast<double>(index) * 100.0 / static_cast<double>(*max)));
    }
    if (index > 100) return std::nullopt;
    return static_cast<int>(index);
}

std::optional<std::string> PlaybackStateParser::inferContext(std::string_view activity) {
    if (activity.empty()) return std::nullopt;
    const auto lower = toLower(activity);
    if (contains(lower, "profile") || contains(lower, "who")) return std::string("profile selection");
    if (contains(lower, "search")) return std::string("search screen");
    if (contains(lower, "player") || contains(lower, "playback")) return std::string("player");
    if (contains(lower, "browse") || contains(lower, "home")) return std::string("browsing/home");
    if (contains(lower, "detail")) return std::string("content details");

    std::string readable(activity);
    for (auto& c : readable) {
        if (c == '.') c = ' ';
    }
    const auto trimmed = trimView(readable);
    if (trimmed.empty()) return std::nullopt;
    return std::string(trimmed);
}

} // namespace tvdeck::tv

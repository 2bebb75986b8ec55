#include "tvdeck/tv/PlaybackState.hpp"
#include "support/TestSupport.hpp"

#include <string>

using namespace tvdeck;
using namespace tvdeck::tv;

namespace {

std::string power(const PlaybackState& s) { return toString(s.power); }
std::string phase(const PlaybackState& s) { return toString(s.phase); }

const char* FULL_DUMP =
    "  mWakefulness=Awake\n"
    "Display Power: state=ON\n"
    "  mCurrentFocus=Window{1a2b3c u0 com.netflix.ninja/com.netflix.ninja.ui.PlayerActivity}\n"
    "  mFocusedApp=ActivityRecord{4d5e u0 com.netflix.ninja/.MainActivity t31}\n"
    "      state=PlaybackState {state=3, position=754000, buffered position=0, speed=1.0, updated=123}\n"
    "      metadata: size=5, description=Dark, Season 1, Netflix\n"
    "- STREAM_MUSIC:\n"
    "   Muted: false\n"
    "   Current: 2 (speaker): 6, 400 (hdmi): 8\n"
    "   Max: 15\n"
    "   streamVolume:6\n"
    "- STREAM_ALARM:\n"
    "   Muted: true\n"
    "   Max: 7\n"
    "   streamVolume:7\n";

void testFullDump() {
    const auto s = PlaybackStateParser::parse(FULL_DUMP);
    ASSERT_EQ(power(s), std::string("on"), "power from wakefulness");
    ASSERT_TRUE(!s.screensaver, "awake is not dreaming");
    ASSERT_EQ(s.foregroundPackage.value_or(""), std::string("com.netflix.ninja"), "focused package");
    ASSERT_EQ(s.foregroundActivity.value_or(""), std::string("com.netflix.ninja.ui.PlayerActivity"),
              "mCurrentFocus preferred over mFocusedApp");
    ASSERT_EQ(s.context.value_or(""), std::string("player"), "context from activity");
    ASSERT_EQ(phase(s), std::string("playing"), "state=3 is playing");
    ASSERT_TRUE(s.isPlaying(), "isPlaying");
    ASSERT_EQ(s.title.value_or(""), std::string("Dark"), "title from description");
    ASSERT_EQ(s.positionMs.value_or(-1), std::int64_t{754000}, "position");
    ASSERT_EQ(s.volume.value_or(-1), 40, "6 of 15 scales to 40");
    ASSERT_TRUE(s.muted.has_value() && !*s.muted, "music stream not muted; alarm section ignored");
}

void testOnlyWakefulness() {
    const auto s = PlaybackStateParser::parse("mWakefulness=Awake\n");
    ASSERT_EQ(power(s), std::string("on"), "power on");
    ASSERT_TRUE(!s.foregroundPackage && !s.foregroundActivity && !s.context, "no focus");
    ASSERT_EQ(phase(s), std::string("unknown"), "phase unknown");
    ASSERT_TRUE(!s.volume && !s.muted && !s.title && !s.positionMs, "rest unknown");
    ASSERT_TRUE(s.summary().find("screen on") == 0, "summary leads with power");
}

void testPowerSources() {
    const auto asleep = PlaybackStateParser::parse("mWakefulness=Asleep\nDisplay Power: state=ON\n");
    ASSERT_EQ(power(asleep), std::string("off"), "wakefulness beats display state");

    const auto display = PlaybackStateParser::parse("Display Power: state=OFF\n");
    ASSERT_EQ(power(display), std::string("off"), "display state alone");

    const auto legacy = PlaybackStateParser::parse("  mScreenOn=true\n");
    ASSERT_EQ(power(legacy), std::string("on"), "legacy mScreenOn");

    const auto dreaming = PlaybackStateParser::parse("mWakefulness=Dreaming\n");
    ASSERT_EQ(power(dreaming), std::string("on"), "dreaming counts as on");
    ASSERT_TRUE(dreaming.screensaver, "screensaver flagged");
    ASSERT_TRUE(dreaming.summary().find("screensaver") != std::string::npos, "summary mentions screensaver");

    const auto dozing = PlaybackStateParser::parse("mWakefulness=Dozing\n");
    ASSERT_EQ(power(dozing), std::string("off"), "dozing counts as off");
}

void testFocusFallback() {
    const auto s = PlaybackStateParser::parse(
        "  mFocusedApp=ActivityRecord{4d5e u0 com.google.android.tvlauncher/.MainActivity t12}\n");
    ASSERT_EQ(s.foregroundPackage.value_or(""), std::string("com.google.android.tvlauncher"), "mFocusedApp used");
    ASSERT_EQ(s.foregroundActivity.value_or(""), std::string(".MainActivity"), "short activity");

    const auto search = PlaybackStateParser::parse(
        "mCurrentFocus=Window{9 u0 com.netflix.ninja/com.netflix.ninja.SearchActivity}\n");
    ASSERT_EQ(search.context.value_or(""), std::string("search screen"), "search context");

    const auto none = PlaybackStateParser::parse("mCurrentFocus=null\n");
    ASSERT_TRUE(!none.foregroundPackage, "null focus stays unknown");
}

void testSessionSelection() {
    const auto s = PlaybackStateParser::parse(
        "state=PlaybackState {state=2, position=1000, speed=0.0}\n"
        "metadata: size=3, description=Paused Show, S1\n"
        "state=PlaybackState {state=3, position=5000, speed=1.0}\n"
        "metadata: size=3, description=Live Match, Sports\n");
    ASSERT_EQ(phase(s), std::string("playing"), "playing session preferred");
    ASSERT_EQ(s.title.value_or(""), std::string("Live Match"), "title of the playing session");
    ASSERT_EQ(s.positionMs.value_or(-1), std::int64_t{5000}, "position of the playing session");

    const auto paused = PlaybackStateParser::parse("state=PlaybackState {state=2, position=10}\n");
    ASSERT_EQ(phase(paused), std::string("paused"), "paused session");
}

void testPhaseCodes() {
    ASSERT_TRUE(PlaybackStateParser::phaseFromCode(6) == PlaybackPhase::Playing, "buffering plays");
    ASSERT_TRUE(PlaybackStateParser::phaseFromCode(4) == PlaybackPhase::Playing, "fast forward plays");
    ASSERT_TRUE(PlaybackStateParser::phaseFromCode(1) == PlaybackPhase::Stopped, "stopped");
    ASSERT_TRUE(PlaybackStateParser::phaseFromCode(7) == PlaybackPhase::Stopped, "error stops");
    ASSERT_TRUE(PlaybackStateParser::phaseFromCode(42) == PlaybackPhase::Unknown, "unknown code");
}

void testVolume() {
    ASSERT_EQ(PlaybackStateParser::normalizeVolume(15, 15L).value_or(-1), 100, "full scale");
    ASSERT_EQ(PlaybackStateParser::normalizeVolume(0, 15L).value_or(-1), 0, "zero");
    ASSERT_TRUE(!PlaybackStateParser::normalizeVolume(16, 15L), "index above max is unknown");
    ASSERT_TRUE(!PlaybackStateParser::normalizeVolume(-1, std::nullopt), "negative is unknown");
    ASSERT_TRUE(!PlaybackStateParser::normalizeVolume(150, std::nullopt), "over 100 without max");
    ASSERT_EQ(PlaybackStateParser::normalizeVolume(55, std::nullopt).value_or(-1), 55, "percent already");

    const auto outOfRange = PlaybackStateParser::parse(
        "- STREAM_MUSIC:\n   Max: 15\n   streamVolume:40\n");
    ASSERT_TRUE(!outOfRange.volume, "out-of-range reading never reported");

    const auto legacy = PlaybackStateParser::parse("STREAM_MUSIC index=30\n");
    ASSERT_EQ(legacy.volume.value_or(-1), 30, "legacy index line");

    const auto muted = PlaybackStateParser::parse("- STREAM_MUSIC:\n   Muted: true\n   Max: 100\n   streamVolume:20\n");
    ASSERT_TRUE(muted.muted.value_or(false), "muted flag");
    ASSERT_TRUE(muted.summary().find("(muted)") != std::string::npos, "summary marks mute");
}

void testGarbage() {
    const auto empty = PlaybackStateParser::parse("");
    ASSERT_EQ(power(empty), std::string("unknown"), "empty dump");

    const auto junk = PlaybackStateParser::parse(
        "\x01\x02 not a dump at all\n=====\nstate=PlaybackState {state=\nmCurrentFocus=\n"
        "description=\n- STREAM_MUSIC:\n Current: abc\n");
    ASSERT_EQ(power(junk), std::string("unknown"), "junk power");
    ASSERT_TRUE(!junk.foregroundPackage && !junk.volume && !junk.title, "junk fields unknown");
    ASSERT_EQ(phase(junk), std::string("unknown"), "unparseable state code");

    const auto at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    const auto stamped = PlaybackStateParser::parse("mWakefulness=Awake", at);
    ASSERT_TRUE(stamped.observedAt == at, "observation time kept");
}

} // namespace

int main() {
    testFullDump();
    testOnlyWakefulness();
    testPowerSources();
    testFocusFallback();
    testSessionSelection();
    testPhaseCodes();
    testVolume();
    testGarbage();
    return test::finish("PlaybackStateParser");
}

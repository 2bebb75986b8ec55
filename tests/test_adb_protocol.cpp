#include "tvdeck/adb/AdbRequest.hpp"
#include "tvdeck/adb/AdbResponse.hpp"
#include "tvdeck/tv/Command.hpp"
#include "tvdeck/tv/KeyCodes.hpp"
#include "tvdeck/tv/TvConfig.hpp"
#include "support/TestSupport.hpp"

#include <array>
#include <cstdint>
#include <string>

using namespace tvdeck;
using namespace tvdeck::adb;

namespace {

std::string wire(const AdbRequest& request) {
    return std::string(reinterpret_cast<const char*>(request.data()), request.size());
}

std::array<std::uint8_t, 4> bytes(const char (&text)[5]) {
    return {static_cast<std::uint8_t>(text[0]), static_cast<std::uint8_t>(text[1]),
            static_cast<std::uint8_t>(text[2]), static_cast<std::uint8_t>(text[3])};
}

void testRequestFraming() {
    const auto connect = AdbRequest::connect("192.168.1.50:5555");
    ASSERT_TRUE(connect.isReady(), "connect request ready");
    ASSERT_EQ(wire(connect), std::string("001ehost:connect:192.168.1.50:5555"), "hex length prefix");

    const auto state = AdbRequest::getState("10.0.0.2:5555");
    ASSERT_EQ(state.serviceName(), std::string("host-serial:10.0.0.2:5555:get-state"), "get-state service");

    const auto shell = AdbRequest::shell("input keyevent KEYCODE_HOME");
    ASSERT_EQ(wire(shell).substr(0, 4), std::string("0021"), "shell length");
    ASSERT_EQ(shell.size(), std::size_t{4 + 33}, "shell total size");

    ASSERT_EQ(AdbRequest::exec("screencap -p").serviceName(), std::string("exec:screencap -p"), "exec service");
    ASSERT_EQ(AdbRequest::transport("tv").serviceName(), std::string("host:transport:tv"), "transport service");

    ASSERT_TRUE(!AdbRequest::service("").isReady(), "empty service rejected");
    ASSERT_TRUE(!AdbRequest::shell(std::string(0x10000, 'x')).isReady(), "oversized service rejected");
    ASSERT_TRUE(AdbRequest::service(std::string(0xFFFF, 'x')).isReady(), "largest service accepted");
    ASSERT_EQ(wire(AdbRequest::service(std::string(0xFFFF, 'x'))).substr(0, 4), std::string("ffff"), "lowercase hex");
}

void testStatusDecode() {
    const auto okay = bytes("OKAY");
    const auto failed = bytes("FAIL");
    const auto other = bytes("WHAT");
    ASSERT_TRUE(AdbResponse::decodeStatus(okay.data(), okay.size()) == AdbStatus::Okay, "OKAY");
    ASSERT_TRUE(AdbResponse::decodeStatus(failed.data(), failed.size()) == AdbStatus::Fail, "FAIL");
    ASSERT_TRUE(AdbResponse::decodeStatus(other.data(), other.size()) == AdbStatus::Invalid, "garbage");
    ASSERT_TRUE(AdbResponse::decodeStatus(okay.data(), 3) == AdbStatus::Invalid, "short status");
    ASSERT_TRUE(AdbResponse::decodeStatus(nullptr, 0) == AdbStatus::Invalid, "null status");
}

void testLengthDecode() {
    const auto small = bytes("001f");
    const auto upper = bytes("0A0B");
    const auto bad = bytes("00g1");
    ASSERT_EQ(AdbResponse::decodeLength(small.data(), small.size()).value_or(0), std::size_t{31}, "0x1f");
    ASSERT_EQ(AdbResponse::decodeLength(upper.data(), upper.size()).value_or(0), std::size_t{0x0A0B}, "uppercase hex");
    ASSERT_TRUE(!AdbResponse::decodeLength(bad.data(), bad.size()), "non-hex digit");
    ASSERT_TRUE(!AdbResponse::decodeLength(small.data(), 2), "short length");
}

void testReplyClassification() {
    ASSERT_TRUE(AdbResponse::isLinkFailure("device '10.0.0.2:5555' not found"), "not found is link");
    ASSERT_TRUE(AdbResponse::isLinkFailure("device offline"), "offline is link");
    ASSERT_TRUE(AdbResponse::isLinkFailure("device unauthorized.\nThis adb server's $ADB_VENDOR_KEYS"), "unauthorized");
    ASSERT_TRUE(!AdbResponse::isLinkFailure("unknown host service"), "unknown service is a refusal");

    ASSERT_TRUE(AdbResponse::isConnectSuccess("connected to 10.0.0.2:5555"), "connected");
    ASSERT_TRUE(AdbResponse::isConnectSuccess("already connected to 10.0.0.2:5555"), "already connected");
    ASSERT_TRUE(!AdbResponse::isConnectSuccess("failed to connect to '10.0.0.2:5555': Connection refused"), "refused");
    ASSERT_TRUE(!AdbResponse::isConnectSuccess("cannot connect to 10.0.0.2:5555"), "cannot connect");

    const auto okay = bytes("OKAY");
    ASSERT_EQ(AdbResponse::toHexLine(okay.data(), okay.size()), std::string("4f 4b 41 59"), "hex dump");
}

void testCommandLines() {
    using tv::Command;
    ASSERT_EQ(Command::keyEvent(tv::keycode::HOME).shellLine(), std::string("input keyevent KEYCODE_HOME"), "key line");
    ASSERT_EQ(Command::textInput("Stranger Things").shellLine(), std::string("input text Stranger%sThings"), "spaces");
    ASSERT_EQ(Command::escapeInputText("Tom & Jerry's"), std::string("Tom%s\\&%sJerry\\'s"), "metacharacters");
    const auto multiline = Command::textInput("a\nreboot\r\tnow").shellLine();
    ASSERT_TRUE(multiline.find_first_of("\n\r\t") == std::string::npos, "line breaks never reach the shell");
    ASSERT_EQ(multiline, std::string("input text a%sreboot%s%snow"), "line breaks become spaces");
    ASSERT_EQ(Command::escapeInputText(std::string("x\0y\x1b\x7fz", 6)), std::string("xyz"), "control bytes dropped");
    ASSERT_EQ(Command::quoteArgument("it's"), std::string("'it'\\''s'"), "quoted argument");
    ASSERT_EQ(Command::screenCapture().shellLine(), std::string("screencap -p"), "capture line");

    ASSERT_TRUE(Command::keyEvent("KEYCODE_HOME").timeout() == tv::config::KEY_EVENT_TIMEOUT, "key default bound");
    ASSERT_TRUE(Command::screenCapture().timeout() == tv::config::SCREEN_CAPTURE_TIMEOUT, "capture default bound");
    auto custom = Command::shell("true").withTimeout(std::chrono::milliseconds(-5));
    ASSERT_TRUE(custom.timeout().count() == 0, "negative bound clamps to zero");
    ASSERT_EQ(Command::shell("ls").describe(), std::string("shell: ls"), "describe");
}

void testKeyNames() {
    ASSERT_TRUE(tv::parseDirection("UP") == tv::Direction::Up, "case-insensitive direction");
    ASSERT_TRUE(tv::parseDirection("ok") == tv::Direction::Select, "ok selects");
    ASSERT_TRUE(tv::parseDirection("enter") == tv::Direction::Select, "enter selects");
    ASSERT_TRUE(!tv::parseDirection("sideways"), "unknown direction");
    ASSERT_EQ(std::string(tv::keycodeFor(tv::Direction::Select)), std::string("KEYCODE_DPAD_CENTER"), "select key");
    ASSERT_TRUE(tv::parseVolumeAction("mute") == tv::VolumeAction::Mute, "mute");
    ASSERT_TRUE(!tv::parseVolumeAction("louder"), "unknown volume action");
    ASSERT_EQ(std::string(tv::keycodeFor(tv::VolumeAction::Down)), std::string("KEYCODE_VOLUME_DOWN"), "volume key");
}

} // namespace

int main() {
    testRequestFraming();
    testStatusDecode();
    testLengthDecode();
    testReplyClassification();
    testCommandLines();
    testKeyNames();
    return test::finish("AdbProtocol");
}

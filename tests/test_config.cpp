#include "tvdeck/config/Config.hpp"
#include "support/TestSupport.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace std::chrono_literals;
using namespace tvdeck;

namespace {

void clearEnvironment() {
    ::unsetenv("TV_DEVICES");
    ::unsetenv("ADB_SERVER_SOCKET");
    ::unsetenv("ANDROID_ADB_SERVER_PORT");
}

void testParseDevices() {
    auto devices = config::parseDevices(R"({
        "living_room": {"ip": "192.168.1.50", "name": "Living Room"},
        "bedroom":     {"ip": "192.168.1.51", "port": 5556, "name": "Bedroom"}
    })");
    ASSERT_TRUE(devices.has_value(), "valid device list");
    if (!devices) return;
    ASSERT_EQ(devices->size(), std::size_t{2}, "two devices");

    const core::Device* living = nullptr;
    const core::Device* bedroom = nullptr;
    for (const auto& d : *devices) {
        if (d.id == "living_room") living = &d;
        if (d.id == "bedroom") bedroom = &d;
    }
    ASSERT_TRUE(living && bedroom, "ids taken from keys");
    if (!living || !bedroom) return;
    ASSERT_EQ(living->port, static_cast<unsigned short>(5555), "port defaults to 5555");
    ASSERT_EQ(living->serial(), std::string("192.168.1.50:5555"), "serial");
    ASSERT_EQ(bedroom->port, static_cast<unsigned short>(5556), "explicit port");
    ASSERT_EQ(bedroom->name, std::string("Bedroom"), "display name");
}

void testInvalidDevices() {
    auto missingIp = config::parseDevices(R"({"tv": {"name": "TV"}})");
    ASSERT_TRUE(!missingIp && missingIp.error().kind == core::ErrorKind::InvalidArgument, "missing ip");

    auto badPort = config::parseDevices(R"({"tv": {"ip": "10.0.0.2", "name": "TV", "port": 70000}})");
    ASSERT_TRUE(!badPort, "port out of range");

    auto notObject = config::parseDevices(R"(["10.0.0.2"])");
    ASSERT_TRUE(!notObject, "array form rejected");

    auto notJson = config::parseDevices("{tv: 10.0.0.2");
    ASSERT_TRUE(!notJson && notJson.error().kind == core::ErrorKind::InvalidArgument, "malformed JSON");

    core::Device a;
    a.id = "tv";
    a.address = "10.0.0.2";
    core::Device b = a;
    auto duplicate = core::DeviceRegistry::create({a, b});
    ASSERT_TRUE(!duplicate, "duplicate ids rejected");

    core::Device blank;
    blank.id = "tv";
    ASSERT_TRUE(!core::DeviceRegistry::create({blank}), "empty address rejected");

    auto registry = core::DeviceRegistry::create({a});
    ASSERT_TRUE(registry && registry->find("tv") != nullptr, "lookup by id");
    ASSERT_TRUE(registry && registry->find("other") == nullptr, "unknown id");
}

void testAdbServerSocket() {
    auto full = config::parseAdbServerSocket("tcp:192.168.1.10:5038");
    ASSERT_TRUE(full && full->host == "192.168.1.10" && full->port == 5038, "tcp:host:port");

    auto portOnly = config::parseAdbServerSocket("tcp:5039");
    ASSERT_TRUE(portOnly && portOnly->host == "127.0.0.1" && portOnly->port == 5039, "tcp:port");

    auto bare = config::parseAdbServerSocket("adb-host:5037");
    ASSERT_TRUE(bare && bare->host == "adb-host" && bare->port == 5037, "host:port");

    ASSERT_TRUE(!config::parseAdbServerSocket("tcp:host:notaport"), "non-numeric port");
    ASSERT_TRUE(!config::parseAdbServerSocket("tcp:0"), "port zero");
}

void testParseConfig() {
    auto loaded = config::parseConfig(R"({
        "devices": {"tv": {"ip": "10.0.0.2", "name": "TV"}},
        "adb_server": "tcp:127.0.0.1:6000",
        "settings": {"max_attempts": 5, "retry_backoff_ms": 250, "settle_delay_ms": 1500,
                     "key_settle_ms": 200, "app_cache_ttl_s": 600, "verify_playback": true,
                     "probe_interval_s": 10, "app_cache_path": "/tmp/apps.json"}
    })");
    ASSERT_TRUE(loaded.has_value(), "full document");
    if (!loaded) return;
    ASSERT_EQ(loaded->devices.size(), std::size_t{1}, "device");
    ASSERT_EQ(loaded->adbServer.port, static_cast<unsigned short>(6000), "adb server");
    ASSERT_EQ(loaded->settings.maxAttempts, 5, "max attempts");
    ASSERT_TRUE(loaded->settings.retryBackoff == 250ms, "backoff");
    ASSERT_TRUE(loaded->settings.launchSettle == 1500ms, "settle");
    ASSERT_TRUE(loaded->settings.keySettle == 200ms, "key settle");
    ASSERT_TRUE(loaded->settings.appCacheTtl == 600s, "ttl");
    ASSERT_TRUE(loaded->settings.verifyPlayback, "verify playback");
    ASSERT_TRUE(loaded->settings.connection.probeInterval == 10s, "probe interval");
    ASSERT_EQ(loaded->settings.appCachePath, std::string("/tmp/apps.json"), "cache path");

    auto defaults = config::parseConfig(R"({"devices": {}})");
    ASSERT_TRUE(defaults && defaults->settings.maxAttempts == 3, "defaults kept");
    ASSERT_TRUE(defaults && defaults->adbServer.port == 5037, "default adb port");

    auto wrongType = config::parseConfig(R"({"devices": {}, "settings": {"max_attempts": "three"}})");
    ASSERT_TRUE(!wrongType && wrongType.error().kind == core::ErrorKind::InvalidArgument, "wrong setting type");
}

void testEnvironment() {
    clearEnvironment();
    auto missing = config::loadConfigFromEnvironment();
    ASSERT_TRUE(!missing, "TV_DEVICES required");

    ::setenv("TV_DEVICES", R"({"tv": {"ip": "10.0.0.2", "name": "TV"}})", 1);
    ::setenv("ANDROID_ADB_SERVER_PORT", "5040", 1);
    auto fromEnv = config::loadConfigFromEnvironment();
    ASSERT_TRUE(fromEnv && fromEnv->devices.size() == 1, "devices from environment");
    ASSERT_TRUE(fromEnv && fromEnv->adbServer.port == 5040, "adb port from environment");

    ::setenv("ADB_SERVER_SOCKET", "tcp:10.0.0.9:5041", 1);
    auto socket = config::loadConfigFromEnvironment();
    ASSERT_TRUE(socket && socket->adbServer.host == "10.0.0.9" && socket->adbServer.port == 5041,
                "socket wins over port");

    ::setenv("ADB_SERVER_SOCKET", "tcp:bogus:x", 1);
    ASSERT_TRUE(!config::loadConfigFromEnvironment(), "bad socket rejected");
    clearEnvironment();
}

void testConfigFile() {
    clearEnvironment();
    const std::string path = "/tmp/tvdeck_config_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"devices": {"tv": {"ip": "10.0.0.2", "port": 5555, "name": "TV"}}})";
    }
    auto loaded = config::loadConfigFile(path);
    ASSERT_TRUE(loaded && loaded->devices.size() == 1, "file loads");

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    auto broken = config::loadConfigFile(path);
    ASSERT_TRUE(!broken, "broken file rejected");
    ASSERT_TRUE(!broken && broken.error().message.find(path) != std::string::npos, "error names the file");

    std::remove(path.c_str());
    ASSERT_TRUE(!config::loadConfigFile(path), "missing file rejected");
}

} // namespace

int main() {
    testParseDevices();
    testInvalidDevices();
    testAdbServerSocket();
    testParseConfig();
    testEnvironment();
    testConfigFile();
    return test::finish("Config");
}

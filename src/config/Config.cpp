#include "tvdeck/config/Config.hpp"

#include "tvdeck/log/Log.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tvdeck::config {

using json = nlohmann::json;
using core::ErrorKind;

namespace {

constexpr const char* ENV_DEVICES = "TV_DEVICES";
constexpr const char* ENV_ADB_SOCKET = "ADB_SERVER_SOCKET";
constexpr const char* ENV_ADB_PORT = "ANDROID_ADB_SERVER_PORT";

expected<unsigned short> parsePort(std::string_view text, std::string_view what) {
    unsigned int value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) {
        return fail(ErrorKind::InvalidArgument,
                    "invalid port '" + std::string(text) + "' in " + std::string(what));
    }
    return static_cast<unsigned short>(value);
}

expected<std::vector<core::Device>> devicesFromJson(const json& node) {
    if (!node.is_object()) {
        return fail(ErrorKind::InvalidArgument, "devices must be an object keyed by device id");
    }

    std::vector<core::Device> devices;
    for (const auto& item : node.items()) {
        const auto& entry = item.value();
        if (!entry.is_object()) {
            return fail(ErrorKind::InvalidArgument, "device '" + item.key() + "' must be an object");
        }
        if (!entry.contains("ip") || !entry["ip"].is_string()) {
            return fail(ErrorKind::InvalidArgument, "device '" + item.key() + "' needs a string \"ip\"");
        }
        if (!entry.contains("name") || !entry["name"].is_string()) {
            return fail(ErrorKind::InvalidArgument, "device '" + item.key() + "' needs a string \"name\"");
        }

        core::Device device;
        device.id = item.key();
        device.address = entry["ip"].get<std::string>();
        device.name = entry["name"].get<std::string>();
        if (entry.contains("port")) {
            const auto& port = entry["port"];
            if (!port.is_number_unsigned() || port.get<unsigned int>() == 0
                || port.get<unsigned int>() > 65535) {
                return fail(ErrorKind::InvalidArgument,
                            "device '" + item.key() + "' has an invalid port");
            }
            device.port = static_cast<unsigned short>(port.get<unsigned int>());
        }
        devices.push_back(std::move(device));
    }

    // Registry validation covers uniqueness and empty fields.
    auto registry = core::DeviceRegistry::create(devices);
    if (!registry) return unexpected(registry.error());
    return devices;
}

void applySettings(const json& node, tv::OrchestratorSettings& settings) {
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    if (node.contains("max_attempts")) {
        settings.maxAttempts = node["max_attempts"].get<int>();
    }
    if (node.contains("retry_backoff_ms")) {
        settings.retryBackoff = milliseconds(node["retry_backoff_ms"].get<long long>());
    }
    if (node.contains("settle_delay_ms")) {
        settings.launchSettle = milliseconds(node["settle_delay_ms"].get<long long>());
    }
    if (node.contains("key_settle_ms")) {
        settings.keySettle = milliseconds(node["key_settle_ms"].get<long long>());
    }
    if (node.contains("app_cache_ttl_s")) {
        settings.appCacheTtl = seconds(node["app_cache_ttl_s"].get<long long>());
    }
    if (node.contains("verify_playback")) {
        settings.verifyPlayback = node["verify_playback"].get<bool>();
    }
    if (node.contains("probe_interval_s")) {
        settings.connection.probeInterval =
            std::chrono::duration_cast<milliseconds>(seconds(node["probe_interval_s"].get<long long>()));
    }
    if (node.contains("app_cache_path")) {
        settings.appCachePath = node["app_cache_path"].get<std::string>();
    }
}

const char* getEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

expected<std::vector<core::Device>> parseDevices(std::string_view text) {
    try {
        return devicesFromJson(json::parse(text));
    } catch (const json::exception& e) {
        return fail(ErrorKind::InvalidArgument, std::string("device list is not valid JSON: ") + e.what());
    }
}

expected<adb::AdbServerEndpoint> parseAdbServerSocket(std::string_view socket) {
    adb::AdbServerEndpoint endpoint;
    std::string_view rest = socket;
    if (rest.rfind("tcp:", 0) == 0) {
        rest.remove_prefix(4);
    }

    const auto colon = rest.rfind(':');
    if (colon == std::string_view::npos) {
        auto port = parsePort(rest, socket);
        if (!port) return unexpected(port.error());
        endpoint.port = *port;
        return endpoint;
    }

    auto port = parsePort(rest.substr(colon + 1), socket);
    if (!port) return unexpected(port.error());
    endpoint.port = *port;
    if (colon > 0) {
        endpoint.host = std::string(rest.substr(0, colon));
    }
    return endpoint;
}

expected<Config> parseConfig(std::string_view text) {
    Config config;
    try {
        const json doc = json::parse(text);
        if (!doc.is_object()) {
            return fail(ErrorKind::InvalidArgument, "configuration must be a JSON object");
        }

        auto devices = devicesFromJson(doc.value("devices", json::object()));
        if (!devices) return unexpected(devices.error());
        config.devices = std::move(*devices);

        if (doc.contains("adb_server")) {
            auto endpoint = parseAdbServerSocket(doc["adb_server"].get<std::string>());
            if (!endpoint) return unexpected(endpoint.error());
            config.adbServer = std::move(*endpoint);
        }
        if (doc.contains("settings")) {
            applySettings(doc["settings"], config.settings);
        }
    } catch (const json::exception& e) {
        return fail(ErrorKind::InvalidArgument, std::string("invalid configuration: ") + e.what());
    }
    return config;
}

expected<Config> loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return fail(ErrorKind::InvalidArgument, "cannot open configuration file " + path,
                    std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto config = parseConfig(buffer.str());
    if (!config) {
        auto err = config.error();
        err.message = path + ": " + err.message;
        return unexpected(std::move(err));
    }
    if (auto env = applyEnvironmentOverrides(*config); !env) {
        return unexpected(env.error());
    }
    logInfo("[Config] loaded ", config->devices.size(), " device(s) from ", path, "\n");
    return config;
}

expected<Config> loadConfigFromEnvironment() {
    const char* devicesJson = getEnv(ENV_DEVICES);
    if (devicesJson == nullptr) {
        return fail(ErrorKind::InvalidArgument,
                    std::string(ENV_DEVICES) + " is not set; pass --config or export it");
    }

    Config config;
    auto devices = parseDevices(devicesJson);
    if (!devices) {
        auto err = devices.error();
        err.message = std::string(ENV_DEVICES) + ": " + err.message;
        return unexpected(std::move(err));
    }
    config.devices = std::move(*devices);

    if (auto env = applyEnvironmentOverrides(config); !env) {
        return unexpected(env.error());
    }
    logInfo("[Config] loaded ", config.devices.size(), " device(s) from ", ENV_DEVICES, "\n");
    return config;
}

expected<void> applyEnvironmentOverrides(Config& config) {
    if (const char* socket = getEnv(ENV_ADB_SOCKET)) {
        auto endpoint = parseAdbServerSocket(socket);
        if (!endpoint) return unexpected(endpoint.error());
        config.adbServer = std::move(*endpoint);
    } else if (const char* port = getEnv(ENV_ADB_PORT)) {
        auto parsed = parsePort(port, ENV_ADB_PORT);
        if (!parsed) return unexpected(parsed.error());
        config.adbServer.port = *parsed;
    }
    return {};
}

} // namespace tvdeck::config

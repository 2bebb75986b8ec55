#pragma once

#include "tvdeck/adb/AdbTransport.hpp"
#include "tvdeck/core/Device.hpp"
#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/Orchestrator.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::config {

/**
 * @brief Everything needed to stand up an orchestrator.
 *
 * File form:
 * @code
 * {
 *   "devices":    { "living_room": {"ip": "192.168.1.50", "port": 5555, "name": "Living Room"} },
 *   "adb_server": "tcp:127.0.0.1:5037",
 *   "settings":   { "max_attempts": 3, "retry_backoff_ms": 500, "settle_delay_ms": 3000,
 *                   "app_cache_ttl_s": 1800, "verify_playback": false,
 *                   "probe_interval_s": 30, "app_cache_path": "apps.json" }
 * }
 * @endcode
 */
struct Config {
    std::vector<core::Device> devices;
    adb::AdbServerEndpoint adbServer;
    tv::OrchestratorSettings settings;
};

/// Parse the `TV_DEVICES` object form: `{ "<id>": {"ip": ..., "port": ..., "name": ...} }`.
expected<std::vector<core::Device>> parseDevices(std::string_view json);

/// Parse `tcp:<host>:<port>`, `tcp:<port>` or `<host>:<port>`.
expected<adb::AdbServerEndpoint> parseAdbServerSocket(std::string_view socket);

/// Parse a whole configuration document (see Config).
expected<Config> parseConfig(std::string_view json);

expected<Config> loadConfigFile(const std::string& path);

/**
 * @brief Build a configuration from the process environment.
 *
 * `TV_DEVICES` is required. The ADB server comes from `ADB_SERVER_SOCKET`,
 * else `ANDROID_ADB_SERVER_PORT`, else 127.0.0.1:5037.
 */
expected<Config> loadConfigFromEnvironment();

/// Apply ADB server overrides from the environment to an already loaded config.
expected<void> applyEnvironmentOverrides(Config& config);

} // namespace tvdeck::config

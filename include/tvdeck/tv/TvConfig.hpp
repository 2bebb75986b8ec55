#pragma once

#include <chrono>
#include <cstddef>

namespace tvdeck::tv::config {

/**
 * @brief Defaults for command bounds, retry, and caching.
 *
 * Runtime overrides live in `OrchestratorSettings`; these values seed it.
 */

// Command deadlines -----------------------------------------------------------
constexpr std::chrono::milliseconds KEY_EVENT_TIMEOUT{5000};
constexpr std::chrono::milliseconds SHELL_TIMEOUT{5000};
constexpr std::chrono::milliseconds TEXT_INPUT_TIMEOUT{5000};
constexpr std::chrono::milliseconds SCREEN_CAPTURE_TIMEOUT{8000};
constexpr std::chrono::milliseconds PROBE_TIMEOUT{3000};
constexpr std::chrono::milliseconds CONNECT_TIMEOUT{5000};

// Retry -----------------------------------------------------------------------
constexpr int MAX_ATTEMPTS = 3;
constexpr std::chrono::milliseconds RETRY_BACKOFF{500};   // grows linearly per attempt

// Launch sequencing -----------------------------------------------------------
constexpr std::chrono::milliseconds LAUNCH_SETTLE_DELAY{3000}; // app load before follow-up keys
constexpr std::chrono::milliseconds KEY_SETTLE_DELAY{500};
constexpr std::chrono::milliseconds POWER_VERIFY_DELAY{1000};
constexpr int POWER_VERIFY_ATTEMPTS = 3;

// Connection liveness ---------------------------------------------------------
constexpr std::chrono::seconds PROBE_INTERVAL{30}; // re-probe a cached link after this long

// App inventory ---------------------------------------------------------------
constexpr std::chrono::minutes APP_CACHE_TTL{30};

} // namespace tvdeck::tv::config

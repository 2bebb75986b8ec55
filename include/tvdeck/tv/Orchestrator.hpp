#pragma once

#include "tvdeck/core/Cancellation.hpp"
#include "tvdeck/core/Device.hpp"
#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/AppCache.hpp"
#include "tvdeck/tv/AppResolver.hpp"
#include "tvdeck/tv/CommandExecutor.hpp"
#include "tvdeck/tv/ConnectionManager.hpp"
#include "tvdeck/tv/KeyCodes.hpp"
#include "tvdeck/tv/PlaybackState.hpp"
#include "tvdeck/tv/TvConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::tv {

struct OrchestratorSettings {
    int maxAttempts = config::MAX_ATTEMPTS;
    std::chrono::milliseconds retryBackoff = config::RETRY_BACKOFF;
    std::chrono::milliseconds launchSettle = config::LAUNCH_SETTLE_DELAY;
    std::chrono::milliseconds keySettle = config::KEY_SETTLE_DELAY;
    std::chrono::milliseconds powerVerifyDelay = config::POWER_VERIFY_DELAY;
    int powerVerifyAttempts = config::POWER_VERIFY_ATTEMPTS;
    bool verifyPlayback = false;        ///< Read status after play and report what was seen.
    std::chrono::seconds appCacheTtl = config::APP_CACHE_TTL;
    ConnectionSettings connection;
    std::string appCachePath;           ///< Empty keeps the app cache in memory only.
};

struct PlayOutcome {
    LaunchIntent intent;
    std::vector<std::string> steps;     ///< Commands issued, in order.
    std::optional<PlaybackState> status;
    bool playbackVerified = false;
};

struct PowerOutcome {
    PowerState before = PowerState::Unknown;
    PowerState after = PowerState::Unknown;
    bool changed = false;               ///< False when the device was already in the target state.
};

struct DeviceAvailability {
    core::Device device;
    bool online = false;
};

/**
 * @brief Intent-level façade over connections, commands, resolver and parser.
 *
 * Every operation takes a device id and returns `expected`. Operations on
 * one device run strictly in arrival order through a per-device FIFO queue,
 * so a multi-step `play` is atomic with respect to everything else on that
 * device; different devices never share a lock. A second request for a busy
 * device waits its turn rather than being rejected.
 *
 * Connection-level failures (Connection, Timeout) are retried up to
 * `maxAttempts`, invalidating the link in between; other failures return
 * immediately. Cancellation is observed between commands, never inside one.
 */
class Orchestrator {
public:
    Orchestrator(core::DeviceRegistry devices,
                 std::shared_ptr<DeviceTransport> transport,
                 OrchestratorSettings settings = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Open content on a device.
     *
     * @param app         Name, alias or package id; may be empty when
     *                    @p queryOrUrl is a URL.
     * @param queryOrUrl  Search text, content URL, or empty to just open the app.
     */
    expected<PlayOutcome> play(const std::string& deviceId, std::string_view app,
                               std::string_view queryOrUrl,
                               const core::CancellationToken& cancel = {});

    expected<void> navigate(const std::string& deviceId, Direction direction,
                            const core::CancellationToken& cancel = {});
    expected<void> navigate(const std::string& deviceId, std::string_view direction,
                            const core::CancellationToken& cancel = {});

    expected<void> volume(const std::string& deviceId, VolumeAction action,
                          const core::CancellationToken& cancel = {});
    expected<void> volume(const std::string& deviceId, std::string_view action,
                          const core::CancellationToken& cancel = {});

    /// Power key toggle.
    expected<void> power(const std::string& deviceId, const core::CancellationToken& cancel = {});

    /// Idempotent: already awake is a successful no-op.
    expected<PowerOutcome> turnOn(const std::string& deviceId,
                                  const core::CancellationToken& cancel = {});
    /// Idempotent: already asleep is a successful no-op.
    expected<PowerOutcome> turnOff(const std::string& deviceId,
                                   const core::CancellationToken& cancel = {});

    /// PNG bytes of the current screen.
    expected<std::vector<std::uint8_t>> screenshot(const std::string& deviceId,
                                                   const core::CancellationToken& cancel = {});

    expected<PlaybackState> getStatus(const std::string& deviceId,
                                      const core::CancellationToken& cancel = {});

    /// Cached inventory when fresh; otherwise one scan shared by concurrent callers.
    expected<std::vector<AppEntry>> listApps(const std::string& deviceId, bool forceRescan = false,
                                             const core::CancellationToken& cancel = {});

    expected<void> playPause(const std::string& deviceId, const core::CancellationToken& cancel = {});

    expected<void> typeText(const std::string& deviceId, std::string_view text,
                            const core::CancellationToken& cancel = {});

    /// Every configured device with a single liveness check each, probed in parallel.
    std::vector<DeviceAvailability> listDevices();

    const core::DeviceRegistry& devices() const { return devices_; }
    const OrchestratorSettings& settings() const { return settings_; }
    AppCache& appCache() { return appCache_; }
    ConnectionManager& connections() { return connections_; }

private:
    /// FIFO ticket lock: callers are served in the order they arrived.
    class DeviceQueue {
    public:
        std::uint64_t enqueue();
        void waitTurn(std::uint64_t ticket);
        void release();

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::uint64_t next_ = 0;
        std::uint64_t serving_ = 0;
    };

    /// Holds a device's turn for the lifetime of one operation.
    class Turn {
    public:
        explicit Turn(DeviceQueue& queue);
        ~Turn();
        Turn(const Turn&) = delete;
        Turn& operator=(const Turn&) = delete;

    private:
        DeviceQueue& queue_;
    };

    expected<const core::Device*> lookup(const std::string& deviceId) const;
    DeviceQueue& queueFor(const core::Device& device);

    CommandResult runWithRetry(const core::Device& device, const Command& command,
                               const core::CancellationToken& cancel);
    expected<void> sendKey(const core::Device& device, const char* keycode,
                           const core::CancellationToken& cancel);
    expected<PlaybackState> readStatus(const core::Device& device,
                                       const core::CancellationToken& cancel);
    expected<AppInventory> scanInventory(const core::Device& device,
                                         const core::CancellationToken& cancel);
    expected<PowerOutcome> setPower(const std::string& deviceId, PowerState target,
                                    const core::CancellationToken& cancel);
    void persistAppCache();

    core::DeviceRegistry devices_;
    OrchestratorSettings settings_;
    ConnectionManager connections_;
    CommandExecutor executor_;
    AppResolver resolver_;
    AppCache appCache_;
    std::map<std::string, std::unique_ptr<DeviceQueue>> queues_;
};

} // namespace tvdeck::tv

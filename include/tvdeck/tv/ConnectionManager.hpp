#pragma once

#include "tvdeck/core/Device.hpp"
#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/DeviceTransport.hpp"
#include "tvdeck/tv/SingleFlight.hpp"
#include "tvdeck/tv/TvConfig.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tvdeck::tv {

using ConnectionPtr = std::shared_ptr<DeviceConnection>;

struct ConnectionSettings {
    std::chrono::milliseconds connectTimeout = config::CONNECT_TIMEOUT;
    std::chrono::milliseconds probeTimeout = config::PROBE_TIMEOUT;
    /// A cached link older than this is re-probed on the next ensure().
    std::chrono::milliseconds probeInterval = config::PROBE_INTERVAL;
};

/**
 * @brief Owns the per-device control link lifecycle.
 *
 * - `ensure()` returns a verified link: freshly opened and probed, or cached
 *   and probed within `probeInterval`.
 * - Establishment is single-flight per device: concurrent callers wait for
 *   the one in-progress attempt and share its result.
 * - `invalidate()` drops the cached link only if it is still the one that
 *   failed, so N callers reporting the same failure cause one teardown and
 *   one reconnect, not N.
 *
 * The map lock is never held across I/O; devices do not block each other.
 */
class ConnectionManager {
public:
    explicit ConnectionManager(std::shared_ptr<DeviceTransport> transport,
                               ConnectionSettings settings = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    expected<ConnectionPtr> ensure(const core::Device& device);

    /// Report that @p failed broke; returns true if this call tore it down.
    bool invalidate(const std::string& deviceId, const ConnectionPtr& failed);

    /// Single ensure() attempt without retry; used for device listings.
    bool isReachable(const core::Device& device);

    bool hasConnection(const std::string& deviceId) const;

    void closeAll();

    const ConnectionSettings& settings() const { return settings_; }

private:
    using clock = std::chrono::steady_clock;

    struct Slot {
        ConnectionPtr connection;
        clock::time_point verifiedAt{};
    };

    expected<ConnectionPtr> establish(const core::Device& device);

    std::shared_ptr<DeviceTransport> transport_;
    ConnectionSettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
    SingleFlight<std::string, expected<ConnectionPtr>> inflight_;
};

} // namespace tvdeck::tv

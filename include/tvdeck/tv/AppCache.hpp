#pragma once

#include "tvdeck/core/Expected.hpp"
#include "tvdeck/tv/SingleFlight.hpp"
#include "tvdeck/tv/TvConfig.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::tv {

struct AppEntry {
    std::string package;
    std::string name;
    std::optional<std::string> icon;    ///< Logo URL.
    std::optional<std::string> color;   ///< Brand colour when there is no logo.

    bool operator==(const AppEntry& other) const {
        return package == other.package && name == other.name
            && icon == other.icon && color == other.color;
    }
};

/// One device's streaming-app inventory, as captured by a single scan.
struct AppInventory {
    std::vector<AppEntry> apps;
    std::vector<std::string> packages;  ///< Every installed package, for resolver lookups.
    std::chrono::system_clock::time_point capturedAt{};
};

/**
 * @brief Per-device app inventory with TTL expiry and de-duplicated refresh.
 *
 * Reads are lock-light and never touch the device. A refresh runs the
 * caller-supplied scan at most once per device at a time; concurrent callers
 * for the same device share its result. Failed scans are not cached.
 */
class AppCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using Scan = std::function<expected<AppInventory>()>;

    explicit AppCache(std::chrono::seconds ttl = config::APP_CACHE_TTL, Clock clock = {});

    /// Cached inventory if captured within the TTL.
    std::optional<AppInventory> fresh(const std::string& deviceId) const;

    /**
     * @brief Fresh inventory, or the result of one scan.
     * @param forceRescan Skip the freshness check (an explicit rescan).
     */
    expected<AppInventory> getOrRefresh(const std::string& deviceId, bool forceRescan,
                                        const Scan& scan);

    void store(const std::string& deviceId, AppInventory inventory);
    void invalidate(const std::string& deviceId);
    void clear();

    std::chrono::seconds ttl() const { return ttl_; }
    std::size_t size() const;

    /// Write every entry as JSON; entries keep their capture time.
    expected<void> save(const std::string& path) const;

    /// Replace the cache with a snapshot written by save(); returns entries loaded.
    expected<std::size_t> load(const std::string& path);

    /// Shell line whose output parsePackageList() reads.
    static const std::string& scanCommand();

    /**
     * @brief Build an inventory from `pm list packages` output.
     *
     * Catalogued apps come first, one entry per display name; other packages
     * matching a streaming keyword follow with a derived name.
     */
    static AppInventory parsePackageList(std::string_view output,
                                         std::chrono::system_clock::time_point capturedAt);

private:
    bool isFresh(const AppInventory& inventory) const;

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, AppInventory> entries_;
    SingleFlight<std::string, expected<AppInventory>> refresh_;
};

} // namespace tvdeck::tv

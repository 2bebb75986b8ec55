#include "tvdeck/tv/AppCache.hpp"

#include "tvdeck/log/Log.hpp"
#include "tvdeck/tv/AppCatalog.hpp"
#include "tvdeck/tv/Url.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace tvdeck::tv {

using json = nlohmann::json;

namespace {

constexpr int SNAPSHOT_VERSION = 1;
constexpr const char* DEFAULT_APP_COLOR = "#3b82f6";

// "com.crunchyroll.crunchyroid" -> "Crunchyroid"
std::string derivedName(const std::string& package) {
    auto name = package.substr(package.rfind('.') + 1);
    if (!name.empty()) {
        name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
    }
    return name;
}

std::int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochSeconds(std::int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

void to_json(json& j, const AppEntry& entry) {
    j = json{{"package", entry.package}, {"name", entry.name}};
    if (entry.icon) j["icon"] = *entry.icon;
    if (entry.color) j["color"] = *entry.color;
}

void from_json(const json& j, AppEntry& entry) {
    j.at("package").get_to(entry.package);
    j.at("name").get_to(entry.name);
    entry.icon.reset();
    entry.color.reset();
    if (j.contains("icon") && j["icon"].is_string()) entry.icon = j["icon"].get<std::string>();
    if (j.contains("color") && j["color"].is_string()) entry.color = j["color"].get<std::string>();
}

AppCache::AppCache(std::chrono::seconds ttl, Clock clock)
: ttl_(ttl)
, clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

bool AppCache::isFresh(const AppInventory& inventory) const {
    const auto age = clock_() - inventory.capturedAt;
    return age >= std::chrono::system_clock::duration::zero() && age < ttl_;
}

std::optional<AppInventory> AppCache::fresh(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(deviceId);
    if (it == entries_.end() || !isFresh(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

expected<AppInventory> AppCache::getOrRefresh(const std::string& deviceId, bool forceRescan,
                                              const Scan& scan) {
    if (!forceRescan) {
        if (auto cached = fresh(deviceId)) {
            return *cached;
        }
    }

    bool joined = false;
    auto result = refresh_.run(deviceId, [&]() -> expected<AppInventory> {
        if (!forceRescan) {
            // A refresh that finished between our check and this flight already did the work.
            if (auto cached = fresh(deviceId)) {
                return *cached;
            }
        }
        auto scanned = scan();
        if (!scanned) {
            logWarning("[AppCache] scan failed for ", deviceId, ": ", scanned.error().describe(), "\n");
            return scanned;
        }
        store(deviceId, *scanned);
        logInfo("[AppCache] ", deviceId, ": ", scanned->apps.size(), " streaming apps, ",
                scanned->packages.size(), " packages\n");
        return scanned;
    }, &joined);

    if (joined) {
        logDebug("[AppCache] ", deviceId, ": joined in-flight scan\n");
    }
    return result;
}

void AppCache::store(const std::string& deviceId, AppInventory inventory) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[deviceId] = std::move(inventory);
}

void AppCache::invalidate(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(deviceId);
}

void AppCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t AppCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

expected<void> AppCache::save(const std::string& path) const {
    json devices = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [deviceId, inventory] : entries_) {
            devices[deviceId] = json{
                {"captured_at", toEpochSeconds(inventory.capturedAt)},
                {"apps", inventory.apps},
                {"packages", inventory.packages},
            };
        }
    }
    const json snapshot{{"version", SNAPSHOT_VERSION}, {"devices", devices}};

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return fail(core::ErrorKind::InvalidArgument, "cannot write app cache to " + path,
                    std::make_error_code(std::errc::io_error));
    }
    out << snapshot.dump(2) << '\n';
    if (!out) {
        return fail(core::ErrorKind::InvalidArgument, "short write to " + path,
                    std::make_error_code(std::errc::io_error));
    }
    return {};
}

expected<std::size_t> AppCache::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return fail(core::ErrorKind::InvalidArgument, "no app cache at " + path,
                    std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::map<std::string, AppInventory> loaded;
    try {
        const json snapshot = json::parse(in);
        if (snapshot.value("version", 0) != SNAPSHOT_VERSION) {
            return fail(core::ErrorKind::InvalidArgument, "unsupported app cache version in " + path);
        }
        for (const auto& item : snapshot.at("devices").items()) {
            const auto& node = item.value();
            AppInventory inventory;
            inventory.capturedAt = fromEpochSeconds(node.at("captured_at").get<std::int64_t>());
            inventory.apps = node.at("apps").get<std::vector<AppEntry>>();
            inventory.packages = node.value("packages", std::vector<std::string>{});
            loaded.emplace(item.key(), std::move(inventory));
        }
    } catch (const json::exception& e) {
        logWarning("[AppCache] ignoring malformed snapshot ", path, ": ", e.what(), "\n");
        return fail(core::ErrorKind::InvalidArgument,
                    "malformed app cache " + path + ": " + e.what());
    }

    const auto count = loaded.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(loaded);
    }
    logInfo("[AppCache] loaded ", count, " device inventories from ", path, "\n");
    return count;
}

const std::string& AppCache::scanCommand() {
    static const std::string command = "pm list packages";
    return command;
}

AppInventory AppCache::parsePackageList(std::string_view output,
                                        std::chrono::system_clock::time_point capturedAt) {
    AppInventory inventory;
    inventory.capturedAt = capturedAt;

    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        auto line = trimView(output.substr(start, end - start));
        start = end + 1;

        if (line.rfind("package:", 0) == 0) line.remove_prefix(8);
        line = trimView(line);
        if (!line.empty()) inventory.packages.emplace_back(line);
    }

    const auto installed = [&](const std::string& pkg) {
        return std::find(inventory.packages.begin(), inventory.packages.end(), pkg)
            != inventory.packages.end();
    };

    std::set<std::string> seenNames;
    std::set<std::string> listed;
    for (const auto& profile : AppCatalog::builtin().profiles()) {
        for (const auto& candidate : profile.packages) {
            if (!installed(candidate.id) || seenNames.count(profile.displayName) != 0) continue;
            seenNames.insert(profile.displayName);
            listed.insert(candidate.id);

            AppEntry entry{candidate.id, profile.displayName, profile.icon, std::nullopt};
            if (!entry.icon) {
                entry.color = profile.color.value_or(DEFAULT_APP_COLOR);
            }
            inventory.apps.push_back(std::move(entry));
        }
    }

    const auto& keywords = AppCatalog::streamingKeywords();
    for (const auto& pkg : inventory.packages) {
        if (listed.count(pkg) != 0 || AppCatalog::builtin().findByPackage(pkg) != nullptr) continue;
        const auto lower = toLower(pkg);
        const bool streaming = std::any_of(keywords.begin(), keywords.end(), [&](const std::string& k) {
            return lower.find(k) != std::string::npos;
        });
        if (streaming) {
            inventory.apps.push_back(AppEntry{pkg, derivedName(pkg), std::nullopt, std::string(DEFAULT_APP_COLOR)});
        }
    }
    return inventory;
}

} // namespace tvdeck::tv

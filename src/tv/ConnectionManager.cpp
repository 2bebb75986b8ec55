#include "tvdeck/tv/ConnectionManager.hpp"
#include "tvdeck/log/Log.hpp"

namespace tvdeck::tv {

using core::ErrorKind;

ConnectionManager::ConnectionManager(std::shared_ptr<DeviceTransport> transport,
                                     ConnectionSettings settings)
: transport_(std::move(transport))
, settings_(settings)
{}

ConnectionManager::~ConnectionManager() {
    closeAll();
}

expected<ConnectionPtr> ConnectionManager::ensure(const core::Device& device) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(device.id);
        if (it != slots_.end() && it->second.connection && it->second.connection->isOpen()
            && clock::now() - it->second.verifiedAt < settings_.probeInterval) {
            return it->second.connection;
        }
    }

    bool joined = false;
    auto result = inflight_.run(device.id, [&] { return establish(device); }, &joined);
    if (joined) {
        logDebug("[ConnectionManager] ", device.id, " joined in-flight connect\n");
    }
    return result;
}

expected<ConnectionPtr> ConnectionManager::establish(const core::Device& device) {
    ConnectionPtr existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(device.id);
        if (it != slots_.end()) {
            existing = it->second.connection;
            // A previous leader may have just finished; reuse its fresh link.
            if (existing && existing->isOpen()
                && clock::now() - it->second.verifiedAt < settings_.probeInterval) {
                return existing;
            }
        }
    }

    if (existing && existing->isOpen()) {
        if (auto alive = existing->probe(settings_.probeTimeout); alive) {
            std::lock_guard<std::mutex> lock(mutex_);
            slots_[device.id].verifiedAt = clock::now();
            return existing;
        } else {
            logWarning("[ConnectionManager] ", device.id, " stale link failed probe: ",
                       alive.error().describe(), "\n");
        }
    }
    if (existing) {
        existing->close();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(device.id);
        if (it != slots_.end() && it->second.connection == existing) {
            slots_.erase(it);
        }
    }

    logInfo("[ConnectionManager] connecting ", device.id, " (", device.serial(), ")\n");

    auto opened = transport_->open(device, settings_.connectTimeout);
    if (!opened) {
        auto err = opened.error();
        err.withContext(device.id, "connect");
        if (err.kind != ErrorKind::Timeout) {
            err.kind = ErrorKind::Connection;
        }
        logError("[ConnectionManager] connect ", device.id, " failed: ", err.describe(), "\n");
        return unexpected(std::move(err));
    }

    ConnectionPtr connection = *opened;
    if (auto alive = connection->probe(settings_.probeTimeout); !alive) {
        auto err = alive.error();
        err.withContext(device.id, "probe");
        if (err.kind != ErrorKind::Timeout) {
            err.kind = ErrorKind::Connection;
        }
        logError("[ConnectionManager] ", device.id, " failed liveness probe: ", err.describe(), "\n");
        connection->close();
        return unexpected(std::move(err));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_[device.id] = Slot{connection, clock::now()};
    }
    logInfo("[ConnectionManager] ", device.id, " connected\n");
    return connection;
}

bool ConnectionManager::invalidate(const std::string& deviceId, const ConnectionPtr& failed) {
    ConnectionPtr victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(deviceId);
        if (it == slots_.end() || !failed || it->second.connection != failed) {
            return false; // already replaced or dropped by another caller
        }
        victim = std::move(it->second.connection);
        slots_.erase(it);
    }
    logWarning("[ConnectionManager] invalidating link to ", deviceId, "\n");
    victim->close();
    return true;
}

bool ConnectionManager::isReachable(const core::Device& device) {
    auto connection = ensure(device);
    if (!connection) {
        logDebug("[ConnectionManager] ", device.id, " unreachable: ",
                 connection.error().describe(), "\n");
    }
    return static_cast<bool>(connection);
}

bool ConnectionManager::hasConnection(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(deviceId);
    return it != slots_.end() && it->second.connection && it->second.connection->isOpen();
}

void ConnectionManager::closeAll() {
    std::map<std::string, Slot> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(slots_);
    }
    for (auto& [id, slot] : drained) {
        if (slot.connection) {
            slot.connection->close();
        }
    }
}

} // namespace tvdeck::tv

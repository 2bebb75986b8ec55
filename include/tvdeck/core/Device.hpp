#pragma once

#include "tvdeck/core/Expected.hpp"

#include <string>
#include <vector>

namespace tvdeck::core {

constexpr unsigned short DEVICE_CONTROL_PORT_DEFAULT = 5555;

/**
 * @brief A configured streaming-TV device. Immutable once loaded.
 */
struct Device {
    std::string id;
    std::string address;
    unsigned short port = DEVICE_CONTROL_PORT_DEFAULT;
    std::string name;

    /// "address:port", the serial the device transport addresses it by.
    std::string serial() const;
};

/**
 * @brief The configured device set, keyed by unique id.
 *
 * Built once at configuration load and read-only afterwards, so lookups need
 * no locking. Preserves configuration order for listing.
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    /// Validate ids (non-empty, unique) and addresses (non-empty, port > 0).
    static expected<DeviceRegistry> create(std::vector<Device> devices);

    const Device* find(const std::string& id) const;
    const std::vector<Device>& devices() const { return devices_; }
    std::size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

private:
    explicit DeviceRegistry(std::vector<Device> devices)
    : devices_(std::move(devices)) {}

    std::vector<Device> devices_;
};

} // namespace tvdeck::core

#include "tvdeck/core/Device.hpp"

#include <algorithm>
#include <unordered_set>

namespace tvdeck::core {

std::string Device::serial() const {
    return address + ":" + std::to_string(port);
}

expected<DeviceRegistry> DeviceRegistry::create(std::vector<Device> devices) {
    std::unordered_set<std::string> seen;
    for (const auto& device : devices) {
        if (device.id.empty()) {
            return fail(ErrorKind::InvalidArgument, "device id must not be empty");
        }
        if (!seen.insert(device.id).second) {
            return fail(ErrorKind::InvalidArgument, "duplicate device id '" + device.id + "'");
        }
        if (device.address.empty()) {
            return fail(ErrorKind::InvalidArgument, "device '" + device.id + "' has no address");
        }
        if (device.port == 0) {
            return fail(ErrorKind::InvalidArgument, "device '" + device.id + "' has port 0");
        }
    }
    return DeviceRegistry(std::move(devices));
}

const Device* DeviceRegistry::find(const std::string& id) const {
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const Device& d) { return d.id == id; });
    return it == devices_.end() ? nullptr : &*it;
}

} // namespace tvdeck::core

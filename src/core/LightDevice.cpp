#include "tvdeck/core/LightDevice.hpp"
#include "tvdeck/log/Log.hpp"

#include <algorithm>

namespace tvdeck::core {

LightDevice::LightDevice(std::string id, std::string name, std::string address)
: id_(std::move(id))
, name_(std::move(name))
, address_(std::move(address))
{}

int LightDevice::clampBrightness(int percent) {
    return std::clamp(percent, 1, 100);
}

expected<void> LightDevice::setBrightness(int percent) {
    const int clamped = clampBrightness(percent);
    if (clamped != percent) {
        logDebug("[LightDevice] ", id_, " brightness ", percent, " clamped to ", clamped, "\n");
    }
    auto result = applyBrightness(clamped);
    if (!result) {
        auto err = result.error();
        err.withContext(id_, "set_brightness");
        logError("[LightDevice] ", err.describe(), "\n");
        return unexpected(std::move(err));
    }
    return {};
}

} // namespace tvdeck::core

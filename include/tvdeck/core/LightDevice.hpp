#pragma once

#include "tvdeck/core/Expected.hpp"

#include <string>

namespace tvdeck::core {

struct LightState {
    bool online = false;
    bool on = false;
    int brightness = 0; ///< 1..100 when known, 0 otherwise.
};

/**
 * @brief Capability interface for smart bulbs and other switchable devices.
 *
 * The vendor protocol lives entirely in subclasses. The base class owns the
 * identity fields and clamps brightness before it reaches the vendor layer.
 */
class LightDevice {
public:
    LightDevice(std::string id, std::string name, std::string address);
    virtual ~LightDevice() = default;

    LightDevice(const LightDevice&) = delete;
    LightDevice& operator=(const LightDevice&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& address() const { return address_; }

    virtual expected<LightState> getState() = 0;
    virtual expected<void> turnOn() = 0;
    virtual expected<void> turnOff() = 0;

    /// Clamp @p percent into 1..100 and forward to the vendor implementation.
    expected<void> setBrightness(int percent);

    static int clampBrightness(int percent);

protected:
    virtual expected<void> applyBrightness(int percent) = 0;

private:
    std::string id_;
    std::string name_;
    std::string address_;
};

} // namespace tvdeck::core

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tvdeck::adb {

/**
 * @brief One smart-socket request: four hex digits of length, then the service name.
 *
 * Build with the named factories; `isReady()` is false when the payload is
 * empty or too long for the 16-bit length prefix.
 */
class AdbRequest {
public:
    static AdbRequest connect(std::string_view serial);     ///< host:connect:<serial>
    static AdbRequest disconnect(std::string_view serial);  ///< host:disconnect:<serial>
    static AdbRequest getState(std::string_view serial);    ///< host-serial:<serial>:get-state
    static AdbRequest transport(std::string_view serial);   ///< host:transport:<serial>
    static AdbRequest shell(std::string_view commandLine);  ///< shell:<line>
    static AdbRequest exec(std::string_view commandLine);   ///< exec:<line>
    static AdbRequest service(std::string_view name);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    const std::string& serviceName() const { return name; }
    bool isReady() const { return ready; }

private:
    explicit AdbRequest(std::string serviceName);

    std::string name;
    std::vector<std::uint8_t> buffer;
    bool ready = false;
};

} // namespace tvdeck::adb

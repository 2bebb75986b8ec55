#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tvdeck::adb {

enum class AdbStatus : std::uint8_t {
    Okay,
    Fail,
    Invalid
};

/**
 * @brief Decoders for the fixed-size pieces of a smart-socket reply.
 */
struct AdbResponse {
    static AdbStatus decodeStatus(const std::uint8_t* data, std::size_t size);

    /// Parse the four-hex-digit length that prefixes FAIL messages and host replies.
    static std::optional<std::size_t> decodeLength(const std::uint8_t* data, std::size_t size);

    /// True when a FAIL message means the link itself is down rather than the request refused.
    static bool isLinkFailure(std::string_view failMessage);

    /// "connected to" / "already connected to" are the only successful connect replies.
    static bool isConnectSuccess(std::string_view reply);

    static const char* toString(AdbStatus status);
    static std::string toHexLine(const std::uint8_t* data, std::size_t size);
};

} // namespace tvdeck::adb

#include "tvdeck/adb/AdbResponse.hpp"
#include "tvdeck/adb/AdbConfig.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tvdeck::adb {
namespace {
int hexValue(std::uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::string_view, 8> LINK_FAILURE_MARKERS{
    "not found",
    "offline",
    "unauthorized",
    "no devices",
    "connection refused",
    "connection reset",
    "cannot connect",
    "closed",
};
} // namespace

AdbStatus AdbResponse::decodeStatus(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::ADB_STATUS_SIZE) {
        return AdbStatus::Invalid;
    }
    const std::string_view tag(reinterpret_cast<const char*>(data), config::ADB_STATUS_SIZE);
    if (tag == "OKAY") return AdbStatus::Okay;
    if (tag == "FAIL") return AdbStatus::Fail;
    return AdbStatus::Invalid;
}

std::optional<std::size_t> AdbResponse::decodeLength(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::ADB_LENGTH_PREFIX_SIZE) {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (std::size_t i = 0; i < config::ADB_LENGTH_PREFIX_SIZE; ++i) {
        const int digit = hexValue(data[i]);
        if (digit < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<std::size_t>(digit);
    }
    return value;
}

bool AdbResponse::isLinkFailure(std::string_view failMessage) {
    const auto lower = lowercase(failMessage);
    return std::any_of(LINK_FAILURE_MARKERS.begin(), LINK_FAILURE_MARKERS.end(),
                       [&](std::string_view marker) { return lower.find(marker) != std::string::npos; });
}

bool AdbResponse::isConnectSuccess(std::string_view reply) {
    const auto lower = lowercase(reply);
    return lower.rfind("connected to", 0) == 0 || lower.rfind("already connected to", 0) == 0;
}

const char* AdbResponse::toString(AdbStatus status) {
    switch (status) {
        case AdbStatus::Okay:    return "OKAY";
        case AdbStatus::Fail:    return "FAIL";
        case AdbStatus::Invalid: return "invalid";
    }
    return "unknown";
}

std::string AdbResponse::toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace tvdeck::adb

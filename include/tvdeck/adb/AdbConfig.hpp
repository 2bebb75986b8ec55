#pragma once

#include <chrono>
#include <cstddef>

namespace tvdeck::adb::config {

/**
 * @brief Constants for the ADB server smart-socket protocol.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short ADB_SERVER_PORT_DEFAULT = 5037;
constexpr const char* ADB_SERVER_HOST_DEFAULT = "127.0.0.1";

// Framing ---------------------------------------------------------------------
constexpr std::size_t ADB_STATUS_SIZE = 4;           // "OKAY" / "FAIL"
constexpr std::size_t ADB_LENGTH_PREFIX_SIZE = 4;    // lowercase hex payload length
constexpr std::size_t ADB_MAX_REQUEST_PAYLOAD = 0xFFFF;
constexpr std::size_t ADB_MAX_MESSAGE_SIZE = 64 * 1024;

// Streams ---------------------------------------------------------------------
constexpr std::size_t ADB_MAX_STREAM_BYTES = 32 * 1024 * 1024; // a 4K PNG capture fits comfortably

} // namespace tvdeck::adb::config

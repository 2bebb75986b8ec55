#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>   // std::error_code

namespace tvdeck::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `tvdeck::net::asio` as the standalone Asio namespace.
 * - `tvdeck::net::tcp` as the protocol alias used by the device transport.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
using duration = std::chrono::milliseconds;

/// Socket bound used until a caller sets its own; matches the key/shell command bound.
constexpr duration kDefaultSocketTimeout{5000};

inline duration sanitize(duration timeout) {
    return timeout.count() < 0 ? duration::zero() : timeout;
}
} // namespace tvdeck::net

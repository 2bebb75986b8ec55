#pragma once
#include "tvdeck/net/NetConfig.hpp"
#include <string>

namespace tvdeck::net {

/**
 * resolve
 *
 * Synchronous lookup of the device-transport server host. Accepts names
 * ("localhost") as well as literal addresses; the result feeds the
 * resolver-results overload of `TcpClient::connect`.
 */
inline error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

} // namespace tvdeck::net

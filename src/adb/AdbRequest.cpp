#include "tvdeck/adb/AdbRequest.hpp"
#include "tvdeck/adb/AdbConfig.hpp"

#include <cstdio>
#include <utility>

namespace tvdeck::adb {

AdbRequest::AdbRequest(std::string serviceName)
: name(std::move(serviceName))
{
    if (name.empty() || name.size() > config::ADB_MAX_REQUEST_PAYLOAD) {
        return;
    }
    char prefix[config::ADB_LENGTH_PREFIX_SIZE + 1];
    std::snprintf(prefix, sizeof(prefix), "%04x", static_cast<unsigned>(name.size()));
    buffer.reserve(config::ADB_LENGTH_PREFIX_SIZE + name.size());
    buffer.insert(buffer.end(), prefix, prefix + config::ADB_LENGTH_PREFIX_SIZE);
    buffer.insert(buffer.end(), name.begin(), name.end());
    ready = true;
}

AdbRequest AdbRequest::connect(std::string_view serial) {
    return AdbRequest("host:connect:" + std::string(serial));
}

AdbRequest AdbRequest::disconnect(std::string_view serial) {
    return AdbRequest("host:disconnect:" + std::string(serial));
}

AdbRequest AdbRequest::getState(std::string_view serial) {
    return AdbRequest("host-serial:" + std::string(serial) + ":get-state");
}

AdbRequest AdbRequest::transport(std::string_view serial) {
    return AdbRequest("host:transport:" + std::string(serial));
}

AdbRequest AdbRequest::shell(std::string_view commandLine) {
    return AdbRequest("shell:" + std::string(commandLine));
}

AdbRequest AdbRequest::exec(std::string_view commandLine) {
    return AdbRequest("exec:" + std::string(commandLine));
}

AdbRequest AdbRequest::service(std::string_view serviceName) {
    return AdbRequest(std::string(serviceName));
}

} // namespace tvdeck::adb

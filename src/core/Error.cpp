#include "tvdeck/core/Error.hpp"

#include <sstream>

namespace tvdeck::core {

Error& Error::withContext(const std::string& device, const std::string& attempted) {
    if (deviceId.empty()) deviceId = device;
    if (command.empty()) command = attempted;
    return *this;
}

const char* Error::toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:      return "connection";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::Rejected:        return "rejected";
        case ErrorKind::Resolution:      return "resolution";
        case ErrorKind::Busy:            return "busy";
        case ErrorKind::Cancelled:       return "cancelled";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::UnknownDevice:   return "unknown-device";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::ostringstream os;
    os << toString(kind);
    if (!deviceId.empty()) {
        os << " on " << deviceId;
    }
    if (!command.empty()) {
        os << " [" << command << "]";
    }
    if (!message.empty()) {
        os << ": " << message;
    }
    if (cause) {
        os << " (" << cause.category().name() << ":" << cause.value()
           << " " << cause.message() << ")";
    }
    return os.str();
}

std::string Error::userHint() const {
    switch (kind) {
        case ErrorKind::Connection:
        case ErrorKind::Timeout:
            return "Device unreachable: check that it is powered on, on the network, and has network debugging enabled.";
        case ErrorKind::Rejected:
            return "Command not supported by the device or the current app.";
        case ErrorKind::Busy:
            return "Device is busy with another operation; try again shortly.";
        case ErrorKind::Resolution:
            return "App not recognised and not installed on the device.";
        case ErrorKind::Cancelled:
            return "Operation cancelled.";
        case ErrorKind::InvalidArgument:
            return "Invalid request.";
        case ErrorKind::UnknownDevice:
            return "Unknown device; check the configured device ids.";
    }
    return {};
}

} // namespace tvdeck::core

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace tvdeck::log {

using LogHandler = std::function<void(std::string_view)>;

/**
 * @brief Severity threshold applied before a message reaches a sink.
 *
 * Debug and Info go to the info sink, Warning and Error to the error sink.
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void setLogLevel(LogLevel level);
LogLevel logLevel();
const char* toString(LogLevel level);

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableVariadic = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

bool enabled(LogLevel level);

} // namespace detail

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (!detail::enabled(LogLevel::Debug)) return;
    logDebug(std::string_view{detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...)});
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    if (!detail::enabled(LogLevel::Info)) return;
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(std::string_view{msg});
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    if (!detail::enabled(LogLevel::Warning)) return;
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logWarning(std::string_view{msg});
}

template<typename First, typename... Rest,
         typename = detail::EnableVariadic<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(std::string_view{msg});
}

} // namespace tvdeck::log

namespace tvdeck {
using log::LogHandler;
using log::LogLevel;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setLogLevel;
using log::logDebug;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace tvdeck

#include "tvdeck/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tvdeck::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();
std::atomic<LogLevel> threshold{LogLevel::Info};

void dispatch(const LogHandler& source, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = source;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace

namespace detail {

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(threshold.load(std::memory_order_relaxed));
}

} // namespace detail

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void setLogLevel(LogLevel level) {
    threshold.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return threshold.load(std::memory_order_relaxed);
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "unknown";
}

void logDebug(std::string_view message) {
    if (!detail::enabled(LogLevel::Debug)) return;
    dispatch(infoHandler, message);
}

void logInfo(std::string_view message) {
    if (!detail::enabled(LogLevel::Info)) return;
    dispatch(infoHandler, message);
}

void logWarning(std::string_view message) {
    if (!detail::enabled(LogLevel::Warning)) return;
    dispatch(errorHandler, message);
}

// Errors bypass the threshold.
void logError(std::string_view message) {
    dispatch(errorHandler, message);
}

} // namespace tvdeck::log

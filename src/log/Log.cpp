#include "mmtrack/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace mmtrack::log {

namespace {

LogHandler streamSink(std::ostream& stream) {
    return [&stream](std::string_view message) {
        stream << message;
        stream.flush();
    };
}

struct Sinks {
    std::mutex mutex;
    LogHandler info = streamSink(std::cout);
    LogHandler error = streamSink(std::cerr);
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

void install(LogHandler& slot, LogHandler handler, std::ostream& fallback) {
    slot = handler ? std::move(handler) : streamSink(fallback);
}

void dispatch(LogHandler Sinks::*slot, std::string_view message) {
    LogHandler handler;
    {
        auto& s = sinks();
        std::lock_guard lock(s.mutex);
        handler = s.*slot;
    }
    // Invoked outside the lock so a handler may log or swap handlers itself.
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(handler), std::cout);
}

void setErrorLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.error, std::move(handler), std::cerr);
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(infoHandler), std::cout);
    install(s.error, std::move(errorHandler), std::cerr);
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void logInfo(std::string_view message) {
    dispatch(&Sinks::info, message);
}

void logError(std::string_view message) {
    dispatch(&Sinks::error, message);
}

ScopedLogHandlers::ScopedLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    previousInfo = s.info;
    previousError = s.error;
    install(s.info, std::move(infoHandler), std::cout);
    install(s.error, std::move(errorHandler), std::cerr);
}

ScopedLogHandlers::~ScopedLogHandlers() {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.info = std::move(previousInfo);
    s.error = std::move(previousError);
}

} // namespace mmtrack::log

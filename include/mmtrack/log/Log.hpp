#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <utility>

namespace mmtrack::log {

/// Receives one fully formatted message. Messages carry their own trailing newline.
using LogHandler = std::function<void(std::string_view)>;

/// Passing an empty handler restores the default (stdout for info, stderr for errors).
void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void logInfo(std::string_view message);
void logError(std::string_view message);

/**
 * @brief RAII helper that installs handlers for the lifetime of the object.
 *
 * The previously installed handlers are restored on destruction, so tests can
 * capture binding output without leaking sinks into later cases.
 */
class ScopedLogHandlers {
public:
    ScopedLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
    ~ScopedLogHandlers();

    ScopedLogHandlers(const ScopedLogHandlers&) = delete;
    ScopedLogHandlers& operator=(const ScopedLogHandlers&) = delete;

private:
    LogHandler previousInfo;
    LogHandler previousError;
};

namespace detail {

template<typename... Args>
std::string formatMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

} // namespace detail

/// Streams every argument into one message; call sites supply the trailing newline.
template<typename... Args>
void logInfo(Args&&... args) {
    const std::string message = detail::formatMessage(std::forward<Args>(args)...);
    logInfo(std::string_view{message});
}

template<typename... Args>
void logError(Args&&... args) {
    const std::string message = detail::formatMessage(std::forward<Args>(args)...);
    logError(std::string_view{message});
}

} // namespace mmtrack::log

namespace mmtrack {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace mmtrack

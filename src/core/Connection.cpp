#include "mmtrack/core/Connection.hpp"

#include "mmtrack/log/Log.hpp"

#include <utility>

namespace mmtrack {

Connection::Connection(std::shared_ptr<NativeApi> nativeApi, std::string portName)
: api(std::move(nativeApi))
, port(std::move(portName))
{}

Connection::~Connection() {
    if (auto result = close(); !result) {
        logError("[Connection] release on destruction failed: ", result.error().message(), "\n");
    }
}

Connection::Connection(Connection&& other) noexcept
: api(std::move(other.api))
, port(std::move(other.port))
{
    other.api.reset();
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    if (auto result = close(); !result) {
        logError("[Connection] release on reassignment failed: ", result.error().message(), "\n");
    }
    api = std::move(other.api);
    port = std::move(other.port);
    other.api.reset();
    return *this;
}

expected<void> Connection::close() {
    if (!api) {
        return {};
    }

    // Detach first so a failing native close can never be retried on the same handle.
    auto nativeApi = std::move(api);
    api.reset();

    const bool closed = nativeApi->closePort();
    nativeApi->releasePort();

    if (!closed) {
        return unexpected(reportNativeFailure(*nativeApi, BindingError::NativeCallFailed, "close port"));
    }

    logInfo("[Connection] closed port ", port, "\n");
    return {};
}

} // namespace mmtrack

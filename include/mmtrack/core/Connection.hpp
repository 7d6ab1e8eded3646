#pragma once

#include "mmtrack/core/Expected.hpp"
#include "mmtrack/native/NativeApi.hpp"

#include <memory>
#include <string>

namespace mmtrack {

struct PortOptions;

/**
 * @brief Exclusive owner of the vendor library's open port.
 *
 * A Connection is open only when produced by `openPort()`. Default-constructed
 * and moved-from instances are closed, and every query against them fails with
 * BindingError::NotConnected. The port is released exactly once, either by
 * `close()` or by the destructor.
 *
 * Not thread-safe: one call at a time per Connection.
 */
class Connection {
public:
    Connection() = default;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    bool isOpen() const noexcept { return api != nullptr; }

    /// Idempotent. The port counts as released even when the native close reports failure.
    expected<void> close();

    /// Port the connection was opened on; "auto" when the vendor searched all ports.
    const std::string& portName() const { return port; }

    /// Native interface behind an open connection, nullptr once closed.
    NativeApi* native() const noexcept { return api.get(); }

private:
    friend expected<Connection> openPort(std::shared_ptr<NativeApi> api, const PortOptions& options);

    Connection(std::shared_ptr<NativeApi> nativeApi, std::string portName);

    std::shared_ptr<NativeApi> api;
    std::string port;
};

} // namespace mmtrack

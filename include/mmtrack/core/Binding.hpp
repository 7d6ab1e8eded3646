#pragma once

#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/core/Connection.hpp"
#include "mmtrack/core/DeviceList.hpp"
#include "mmtrack/core/Expected.hpp"
#include "mmtrack/native/NativeApi.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mmtrack {

/// Version number reported by the vendor library.
struct ApiVersion {
    std::uint32_t value = 0;

    std::string toString() const;
};

struct PortOptions {
    /// Keep retrying the native open until this much time has passed; 0 tries exactly once.
    std::chrono::seconds timeout = config::OPEN_TIMEOUT_DEFAULT;

    /// Serial device to open. Empty lets the vendor search every port for a modem or beacon.
    std::optional<std::string> portName{};
};

/**
 * @brief Read the vendor library's API version.
 *
 * Fails with NativeCallFailed when the vendor call fails, or InvalidEncoding
 * when it reports version 0.
 */
expected<ApiVersion> apiVersion(NativeApi& api);

/**
 * @brief Open the vendor port and return the Connection that owns it.
 *
 * Rejected port names, an already claimed NativeApi, and native open failures
 * all yield BindingError::PortUnavailable.
 */
expected<Connection> openPort(std::shared_ptr<NativeApi> api, const PortOptions& options);
expected<Connection> openPort(std::shared_ptr<NativeApi> api, std::chrono::seconds timeout);
expected<Connection> openPort(std::shared_ptr<NativeApi> api);

/// Read the devices known to the modem; positions stay unresolved until updated.
expected<DeviceList> getDeviceList(const Connection& connection);

/// `/dev/...` on POSIX hosts, `COMn` or `\\.\COMn` on Windows.
bool isSupportedPortName(std::string_view name);

} // namespace mmtrack

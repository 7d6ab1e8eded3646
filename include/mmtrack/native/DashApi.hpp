#pragma once

#include "mmtrack/native/NativeApi.hpp"

#include <memory>

namespace mmtrack {

/**
 * @brief NativeApi backed by the vendor's `dashapi` shared library.
 *
 * Every method forwards to the matching `mm_*` C entry point. The vendor
 * library holds one process-wide port, so use `defaultNativeApi()` rather
 * than constructing several instances.
 */
class DashApi final : public NativeApi {
public:
    DashApi() = default;

    bool lastError(std::uint32_t& code) override;
    bool apiVersion(std::uint32_t& version) override;
    bool openPort() override;
    /// Fails when the installed library predates `mm_open_port_by_name`.
    bool openPortByName(const char* portName) override;
    bool closePort() override;
    bool readDevicesList(std::uint8_t* buffer, std::size_t size) override;
    bool readLastLocations(std::uint8_t* buffer, std::size_t size) override;
};

/// Process-wide DashApi instance.
std::shared_ptr<NativeApi> defaultNativeApi();

} // namespace mmtrack

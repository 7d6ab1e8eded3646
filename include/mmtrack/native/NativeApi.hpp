#pragma once

#include "mmtrack/core/BindingError.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace mmtrack {

/**
 * @brief Abstract view of the vendor positioning library's C interface.
 *
 * Each method mirrors one vendor entry point and returns the vendor's success
 * flag unchanged; translation into typed results happens in the binding layer.
 * Buffers passed to the read methods are sized with the constants from
 * `BindingConfig.hpp` and are filled with the vendor's packed little-endian
 * records.
 *
 * The vendor library keeps a single process-wide port, so a NativeApi can be
 * claimed by at most one open Connection at a time (`tryClaimPort`).
 *
 * Calls are not reentrant; callers serialise access per instance.
 */
class NativeApi {
public:
    NativeApi() = default;
    virtual ~NativeApi() = default;

    NativeApi(const NativeApi&) = delete;
    NativeApi& operator=(const NativeApi&) = delete;

    virtual bool lastError(std::uint32_t& code) = 0;
    virtual bool apiVersion(std::uint32_t& version) = 0;

    /// Searches all serial ports for a vendor modem or beacon.
    virtual bool openPort() = 0;
    virtual bool openPortByName(const char* portName) = 0;
    virtual bool closePort() = 0;

    virtual bool readDevicesList(std::uint8_t* buffer, std::size_t size) = 0;
    virtual bool readLastLocations(std::uint8_t* buffer, std::size_t size) = 0;

    /// True when the most recent failed call gave up on a timeout. The vendor
    /// library has no such signal, so the default is false.
    virtual bool lastCallTimedOut() { return false; }

    bool tryClaimPort() noexcept;
    void releasePort() noexcept;
    bool portClaimed() const noexcept;

private:
    std::atomic<bool> claimed{false};
};

/// Query and classify the vendor error left by the most recent failed call.
NativeError lastNativeError(NativeApi& api);

/**
 * @brief Log a failed native call and build the error to return for it.
 *
 * `kind` is returned unchanged, except that a NativeCallFailed whose call
 * timed out (`lastCallTimedOut()`) becomes BindingError::Timeout. Open
 * failures always stay PortUnavailable.
 */
std::error_code reportNativeFailure(NativeApi& api, BindingError kind, std::string_view where);

} // namespace mmtrack

#pragma once
#include "mmtrack/native/NativeApi.hpp"
#include "mmtrack/native/NativeRecords.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace mmtrack::dummy {

/**
 * @brief In-process stand-in for the vendor library, backed by simulated devices.
 *
 * Produces byte-exact vendor records so the full decode path is exercised
 * without hardware. Failures are scripted per call family; a failed call
 * leaves `lastErrorCode` as the vendor would.
 *
 * At most six located devices are reported per last-locations read, as the
 * vendor does; larger fleets are reported round-robin across reads.
 */
class DummyDashApi : public NativeApi {
public:
    static constexpr std::uint32_t ERROR_COMMUNICATION = 1;
    static constexpr std::uint32_t ERROR_SERIAL_PORT = 2;
    static constexpr std::uint32_t ERROR_LICENSE = 3;

    DummyDashApi();

    void setApiVersion(std::uint32_t version);
    void setVersionFailure(bool fail, std::uint32_t vendorError = ERROR_COMMUNICATION);

    /// Fail the next `count` open attempts with `vendorError`.
    void failNextOpens(std::size_t count, std::uint32_t vendorError = ERROR_SERIAL_PORT);
    void setCloseFailure(bool fail);
    void setDevicesListFailure(bool fail, std::uint32_t vendorError = ERROR_COMMUNICATION);
    void setLocationsFailure(bool fail, std::uint32_t vendorError = ERROR_COMMUNICATION);
    /// Fail last-locations reads as timed out.
    void setLocationsTimeout(bool enabled);

    void addDevice(const native::DeviceRecord& record);
    void addDevice(std::uint8_t address, std::uint8_t typeId = 31);
    void setLocation(std::uint8_t address, std::int32_t x, std::int32_t y, std::int32_t z, std::uint8_t q);
    /// An unresolved device is left out of last-locations reads.
    void setResolved(std::uint8_t address, bool resolved);
    /// Move every located device along a circle on each last-locations read.
    void setMotion(bool enabled);

    std::size_t openCalls() const;
    std::size_t closeCalls() const;
    std::size_t locationReads() const;
    bool isPortOpen() const;

    bool lastError(std::uint32_t& code) override;
    bool apiVersion(std::uint32_t& version) override;
    bool openPort() override;
    bool openPortByName(const char* portName) override;
    bool closePort() override;
    bool readDevicesList(std::uint8_t* buffer, std::size_t size) override;
    bool readLastLocations(std::uint8_t* buffer, std::size_t size) override;
    bool lastCallTimedOut() override;

private:
    struct SimulatedDevice {
        native::DeviceRecord info{};
        native::LocationRecord location{};
        bool located = false;
        bool resolved = true;
    };

    bool openLocked();
    bool fail(std::uint32_t vendorError);
    void stepMotionLocked();

    mutable std::mutex mutex;
    std::vector<SimulatedDevice> devices;

    std::uint32_t version = 7;
    std::uint32_t lastErrorCode = 0;
    bool versionFails = false;
    std::uint32_t versionError = ERROR_COMMUNICATION;
    std::size_t pendingOpenFailures = 0;
    std::uint32_t openError = ERROR_SERIAL_PORT;
    bool closeFails = false;
    bool listFails = false;
    std::uint32_t listError = ERROR_COMMUNICATION;
    bool locationsFail = false;
    std::uint32_t locationsError = ERROR_COMMUNICATION;
    bool locationsTimeout = false;
    bool timedOut = false;
    bool motion = false;

    bool portOpen = false;
    std::size_t opens = 0;
    std::size_t closes = 0;
    std::size_t reads = 0;
    std::size_t cursor = 0;
};

} // namespace mmtrack::dummy

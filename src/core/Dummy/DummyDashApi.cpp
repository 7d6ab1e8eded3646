#include "mmtrack/core/Dummy/DummyDashApi.hpp"
#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/log/Log.hpp"

#include <cmath>

namespace mmtrack::dummy {

DummyDashApi::DummyDashApi() = default;

void DummyDashApi::setApiVersion(std::uint32_t value) {
    std::lock_guard lock(mutex);
    version = value;
}

void DummyDashApi::setVersionFailure(bool failCalls, std::uint32_t vendorError) {
    std::lock_guard lock(mutex);
    versionFails = failCalls;
    versionError = vendorError;
}

void DummyDashApi::failNextOpens(std::size_t count, std::uint32_t vendorError) {
    std::lock_guard lock(mutex);
    pendingOpenFailures = count;
    openError = vendorError;
}

void DummyDashApi::setCloseFailure(bool failCalls) {
    std::lock_guard lock(mutex);
    closeFails = failCalls;
}

void DummyDashApi::setDevicesListFailure(bool failCalls, std::uint32_t vendorError) {
    std::lock_guard lock(mutex);
    listFails = failCalls;
    listError = vendorError;
}

void DummyDashApi::setLocationsFailure(bool failCalls, std::uint32_t vendorError) {
    std::lock_guard lock(mutex);
    locationsFail = failCalls;
    locationsError = vendorError;
}

void DummyDashApi::setLocationsTimeout(bool enabled) {
    std::lock_guard lock(mutex);
    locationsTimeout = enabled;
}

void DummyDashApi::addDevice(const native::DeviceRecord& record) {
    std::lock_guard lock(mutex);
    SimulatedDevice device;
    device.info = record;
    device.location.address = record.address;
    devices.push_back(device);
}

void DummyDashApi::addDevice(std::uint8_t address, std::uint8_t typeId) {
    native::DeviceRecord record;
    record.address = address;
    record.versionMajor = 7;
    record.versionMinor = 2;
    record.versionSecond = 1;
    record.typeId = typeId;
    record.flags = config::DEVICE_FLAG_CONNECTED;
    addDevice(record);
}

void DummyDashApi::setLocation(std::uint8_t address, std::int32_t x, std::int32_t y,
                               std::int32_t z, std::uint8_t q) {
    std::lock_guard lock(mutex);
    // Every matching entry moves together, as duplicated addresses share one radio slot.
    for (auto& device : devices) {
        if (device.info.address != address) {
            continue;
        }
        device.location.x = x;
        device.location.y = y;
        device.location.z = z;
        device.location.q = q;
        device.located = true;
    }
}

void DummyDashApi::setResolved(std::uint8_t address, bool resolvedValue) {
    std::lock_guard lock(mutex);
    for (auto& device : devices) {
        if (device.info.address == address) {
            device.resolved = resolvedValue;
        }
    }
}

void DummyDashApi::setMotion(bool enabled) {
    std::lock_guard lock(mutex);
    motion = enabled;
}

std::size_t DummyDashApi::openCalls() const {
    std::lock_guard lock(mutex);
    return opens;
}

std::size_t DummyDashApi::closeCalls() const {
    std::lock_guard lock(mutex);
    return closes;
}

std::size_t DummyDashApi::locationReads() const {
    std::lock_guard lock(mutex);
    return reads;
}

bool DummyDashApi::isPortOpen() const {
    std::lock_guard lock(mutex);
    return portOpen;
}

bool DummyDashApi::lastError(std::uint32_t& code) {
    std::lock_guard lock(mutex);
    code = lastErrorCode;
    return true;
}

bool DummyDashApi::lastCallTimedOut() {
    std::lock_guard lock(mutex);
    return timedOut;
}

bool DummyDashApi::apiVersion(std::uint32_t& value) {
    std::lock_guard lock(mutex);
    if (versionFails) {
        return fail(versionError);
    }
    value = version;
    return true;
}

bool DummyDashApi::openPort() {
    std::lock_guard lock(mutex);
    return openLocked();
}

bool DummyDashApi::openPortByName(const char* portName) {
    std::lock_guard lock(mutex);
    if (!portName || *portName == '\0') {
        return fail(ERROR_SERIAL_PORT);
    }
    return openLocked();
}

bool DummyDashApi::closePort() {
    std::lock_guard lock(mutex);
    ++closes;
    if (!portOpen) {
        return fail(ERROR_SERIAL_PORT);
    }
    portOpen = false;
    logInfo("[DummyDashApi] port closed\n");
    if (closeFails) {
        return fail(ERROR_COMMUNICATION);
    }
    return true;
}

bool DummyDashApi::readDevicesList(std::uint8_t* buffer, std::size_t size) {
    std::lock_guard lock(mutex);
    if (!portOpen) {
        return fail(ERROR_COMMUNICATION);
    }
    if (listFails) {
        return fail(listError);
    }
    if (!buffer || size < config::DEVICES_LIST_SIZE) {
        return fail(ERROR_COMMUNICATION);
    }

    native::DevicesListRecord record;
    record.devices.reserve(devices.size());
    for (const auto& device : devices) {
        record.devices.push_back(device.info);
    }

    native::ByteBuffer out(config::DEVICES_LIST_SIZE);
    record.encode(out);
    out.copyTo(buffer, size);
    return true;
}

bool DummyDashApi::readLastLocations(std::uint8_t* buffer, std::size_t size) {
    std::lock_guard lock(mutex);
    if (!portOpen) {
        return fail(ERROR_COMMUNICATION);
    }
    if (locationsTimeout) {
        fail(ERROR_COMMUNICATION);
        timedOut = true;
        return false;
    }
    if (locationsFail) {
        return fail(locationsError);
    }
    if (!buffer || size < config::LAST_LOCATIONS_SIZE) {
        return fail(ERROR_COMMUNICATION);
    }

    ++reads;
    if (motion) {
        stepMotionLocked();
    }

    native::LastLocationsRecord record;
    std::size_t filled = 0;
    const std::size_t total = devices.size();
    for (std::size_t n = 0; n < total && filled < record.slots.size(); ++n) {
        const auto& device = devices[(cursor + n) % total];
        if (!device.located || !device.resolved) {
            continue;
        }
        bool alreadyReported = false;
        for (std::size_t i = 0; i < filled; ++i) {
            alreadyReported = alreadyReported || record.slots[i].address == device.info.address;
        }
        if (alreadyReported) {
            continue;
        }
        record.slots[filled++] = device.location;
    }
    if (total > record.slots.size()) {
        cursor = (cursor + record.slots.size()) % total;
    }
    record.isNew = filled > 0;

    native::ByteBuffer out(config::LAST_LOCATIONS_SIZE);
    record.encode(out);
    out.copyTo(buffer, size);
    return true;
}

bool DummyDashApi::openLocked() {
    ++opens;
    if (pendingOpenFailures > 0) {
        --pendingOpenFailures;
        return fail(openError);
    }
    portOpen = true;
    lastErrorCode = 0;
    logInfo("[DummyDashApi] port open, ", devices.size(), " simulated device(s)\n");
    return true;
}

bool DummyDashApi::fail(std::uint32_t vendorError) {
    lastErrorCode = vendorError;
    timedOut = false;
    return false;
}

void DummyDashApi::stepMotionLocked() {
    constexpr double radiusMm = 1500.0;
    constexpr double stepRadians = 0.01;
    const double phase = static_cast<double>(reads) * stepRadians;

    for (std::size_t i = 0; i < devices.size(); ++i) {
        auto& device = devices[i];
        if (!device.located) {
            continue;
        }
        // Stationary beacons keep their position; only hedgehogs move.
        const auto type = device.info.typeId;
        const bool mobile = type == 23 || type == 31 || type == 43 || type == 45;
        if (!mobile) {
            continue;
        }
        const double angle = phase + static_cast<double>(i);
        device.location.x = static_cast<std::int32_t>(std::lround(radiusMm * std::cos(angle)));
        device.location.y = static_cast<std::int32_t>(std::lround(radiusMm * std::sin(angle)));
    }
}

} // namespace mmtrack::dummy

#pragma once

#include "mmtrack/native/NativeRecords.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mmtrack {

/// Hardware models reported in the vendor devices list (values are vendor type ids).
enum class DeviceType : std::uint8_t {
    Unknown = 0,
    BeaconHwV45 = 22,
    BeaconHwV45Hedgehog = 23,
    ModemHwV49 = 24,
    BeaconHwV49 = 30,
    BeaconHwV49Hedgehog = 31,
    BeaconMiniRx = 32,
    BeaconMiniTx = 36,
    BeaconTxIp67 = 37,
    BeaconIndustrialRx = 41,
    SuperBeacon = 42,
    SuperBeaconHedgehog = 43,
    IndustrialSuperBeacon = 44,
    IndustrialSuperBeaconHedgehog = 45,
    SuperModem = 46,
    ModemHwV51 = 48
};

/// Maps a vendor type id; ids outside the known set map to DeviceType::Unknown.
DeviceType deviceTypeFromId(std::uint8_t typeId) noexcept;
const char* toString(DeviceType type) noexcept;

/// Firmware version triple, e.g. V6.07a is {6, 7, 1}.
struct FirmwareVersion {
    std::uint8_t versionMajor = 0;
    std::uint8_t versionMinor = 0;
    std::uint8_t versionSecond = 0;

    std::string toString() const;
};

/**
 * @brief One tracked unit inside a DeviceList snapshot.
 *
 * Coordinates are signed millimetres (divide by 1000 for metres). Until a
 * location has been applied the coordinates and quality are zero and
 * `hasLocation()` is false.
 */
class Device {
public:
    using Clock = std::chrono::system_clock;

    Device() = default;
    Device(std::uint16_t address, std::int32_t x, std::int32_t y, std::int32_t z, std::uint8_t q);

    static Device fromRecord(const native::DeviceRecord& record, Clock::time_point listedAt);

    std::uint16_t address() const { return addr; }
    std::int32_t x() const { return posX; }
    std::int32_t y() const { return posY; }
    std::int32_t z() const { return posZ; }
    std::uint8_t q() const { return quality; }

    bool isDuplicated() const { return duplicated; }
    bool isSleeping() const { return sleeping; }
    bool isConnected() const { return connected; }
    FirmwareVersion firmware() const { return version; }
    DeviceType type() const { return deviceType; }
    std::uint8_t typeId() const { return rawTypeId; }

    bool hasLocation() const { return located; }
    Clock::time_point updateTime() const { return updatedAt; }

    std::string describe() const;

private:
    friend class DeviceList;
    void applyLocation(const native::LocationRecord& location, Clock::time_point when);

    std::uint16_t addr = 0;
    std::int32_t posX = 0;
    std::int32_t posY = 0;
    std::int32_t posZ = 0;
    std::uint8_t quality = 0;

    bool duplicated = false;
    bool sleeping = false;
    bool connected = false;
    FirmwareVersion version{};
    DeviceType deviceType = DeviceType::Unknown;
    std::uint8_t rawTypeId = 0;

    bool located = false;
    Clock::time_point updatedAt{};
};

} // namespace mmtrack

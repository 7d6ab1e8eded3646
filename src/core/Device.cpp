#include "mmtrack/core/Device.hpp"

#include <iomanip>
#include <sstream>

namespace mmtrack {

DeviceType deviceTypeFromId(std::uint8_t typeId) noexcept {
    switch (typeId) {
        case 22: return DeviceType::BeaconHwV45;
        case 23: return DeviceType::BeaconHwV45Hedgehog;
        case 24: return DeviceType::ModemHwV49;
        case 30: return DeviceType::BeaconHwV49;
        case 31: return DeviceType::BeaconHwV49Hedgehog;
        case 32: return DeviceType::BeaconMiniRx;
        case 36: return DeviceType::BeaconMiniTx;
        case 37: return DeviceType::BeaconTxIp67;
        case 41: return DeviceType::BeaconIndustrialRx;
        case 42: return DeviceType::SuperBeacon;
        case 43: return DeviceType::SuperBeaconHedgehog;
        case 44: return DeviceType::IndustrialSuperBeacon;
        case 45: return DeviceType::IndustrialSuperBeaconHedgehog;
        case 46: return DeviceType::SuperModem;
        case 48: return DeviceType::ModemHwV51;
        default: return DeviceType::Unknown;
    }
}

const char* toString(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::Unknown:                       return "unknown";
        case DeviceType::BeaconHwV45:                   return "Beacon HW V4.5";
        case DeviceType::BeaconHwV45Hedgehog:           return "Beacon HW V4.5 (hedgehog)";
        case DeviceType::ModemHwV49:                    return "Modem HW V4.9";
        case DeviceType::BeaconHwV49:                   return "Beacon HW V4.9";
        case DeviceType::BeaconHwV49Hedgehog:           return "Beacon HW V4.9 (hedgehog)";
        case DeviceType::BeaconMiniRx:                  return "Beacon Mini-RX";
        case DeviceType::BeaconMiniTx:                  return "Beacon Mini-TX";
        case DeviceType::BeaconTxIp67:                  return "Beacon-TX-IP67";
        case DeviceType::BeaconIndustrialRx:            return "Beacon Industrial-RX";
        case DeviceType::SuperBeacon:                   return "Super-Beacon";
        case DeviceType::SuperBeaconHedgehog:           return "Super-Beacon (hedgehog)";
        case DeviceType::IndustrialSuperBeacon:         return "Industrial Super-Beacon";
        case DeviceType::IndustrialSuperBeaconHedgehog: return "Industrial Super-Beacon (hedgehog)";
        case DeviceType::SuperModem:                    return "Super-Modem";
        case DeviceType::ModemHwV51:                    return "Modem HW V5.1";
    }
    return "unknown";
}

std::string FirmwareVersion::toString() const {
    std::ostringstream os;
    os << 'V' << static_cast<int>(versionMajor) << '.'
       << std::setw(2) << std::setfill('0') << static_cast<int>(versionMinor);
    if (versionSecond > 0 && versionSecond <= 26) {
        os << static_cast<char>('a' + versionSecond - 1);
    } else if (versionSecond > 26) {
        os << '.' << static_cast<int>(versionSecond);
    }
    return os.str();
}

Device::Device(std::uint16_t address, std::int32_t x, std::int32_t y, std::int32_t z, std::uint8_t q)
: addr(address)
, posX(x)
, posY(y)
, posZ(z)
, quality(q)
, located(true)
, updatedAt(Clock::now())
{}

Device Device::fromRecord(const native::DeviceRecord& record, Clock::time_point listedAt) {
    Device device;
    device.addr = record.address;
    device.duplicated = record.isDuplicated != 0;
    device.sleeping = record.isSleeping != 0;
    device.connected = (record.flags & config::DEVICE_FLAG_CONNECTED) != 0;
    device.version = FirmwareVersion{record.versionMajor, record.versionMinor, record.versionSecond};
    device.rawTypeId = record.typeId;
    device.deviceType = deviceTypeFromId(record.typeId);
    device.updatedAt = listedAt;
    return device;
}

void Device::applyLocation(const native::LocationRecord& location, Clock::time_point when) {
    posX = location.x;
    posY = location.y;
    posZ = location.z;
    quality = location.q;
    located = true;
    updatedAt = when;
}

std::string Device::describe() const {
    std::ostringstream os;
    os << "address #" << std::setw(3) << std::setfill('0') << addr << std::setfill(' ')
       << ' ' << mmtrack::toString(deviceType) << ' ' << version.toString();
    if (duplicated) os << " duplicated";
    if (sleeping) os << " sleeping";
    if (connected) os << " connected";
    return os.str();
}

} // namespace mmtrack

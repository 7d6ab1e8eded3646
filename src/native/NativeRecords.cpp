#include "mmtrack/native/NativeRecords.hpp"

#include <algorithm>

namespace mmtrack::native {
namespace {

std::uint32_t read_le_u32(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0])
         | (static_cast<std::uint32_t>(data[1]) << 8)
         | (static_cast<std::uint32_t>(data[2]) << 16)
         | (static_cast<std::uint32_t>(data[3]) << 24);
}

std::int32_t read_le_i32(const std::uint8_t* data) {
    return static_cast<std::int32_t>(read_le_u32(data));
}

DeviceRecord decodeDevice(const std::uint8_t* data) {
    DeviceRecord record;
    record.address = data[0];
    record.isDuplicated = data[1];
    record.isSleeping = data[2];
    record.versionMajor = data[3];
    record.versionMinor = data[4];
    record.versionSecond = data[5];
    record.typeId = data[6];
    record.firmwareOption = data[7];
    record.flags = data[8];
    return record;
}

LocationRecord decodeLocation(const std::uint8_t* data) {
    LocationRecord record;
    record.address = data[0];
    record.headIndex = data[1];
    record.x = read_le_i32(data + 2);
    record.y = read_le_i32(data + 6);
    record.z = read_le_i32(data + 10);
    record.statusFlag = data[14];
    record.q = data[15];
    // bytes 16..19 are reserved
    return record;
}

} // namespace

void DeviceRecord::encode(ByteBuffer& out) const {
    out.appendUInt8(address);
    out.appendUInt8(isDuplicated);
    out.appendUInt8(isSleeping);
    out.appendUInt8(versionMajor);
    out.appendUInt8(versionMinor);
    out.appendUInt8(versionSecond);
    out.appendUInt8(typeId);
    out.appendUInt8(firmwareOption);
    out.appendUInt8(flags);
}

bool DevicesListRecord::decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::DEVICES_LIST_SIZE) {
        return false;
    }

    const std::size_t count = data[0];
    devices.clear();
    devices.reserve(count);

    const std::uint8_t* slot = data + 1;
    for (std::size_t i = 0; i < count; ++i, slot += config::DEVICE_RECORD_SIZE) {
        devices.push_back(decodeDevice(slot));
    }
    return true;
}

void DevicesListRecord::encode(ByteBuffer& out) const {
    const std::size_t count = std::min(devices.size(), config::DEVICE_SLOTS - 1);
    out.appendUInt8(static_cast<std::uint8_t>(count));
    for (std::size_t i = 0; i < count; ++i) {
        devices[i].encode(out);
    }
    out.appendZeros((config::DEVICE_SLOTS - count) * config::DEVICE_RECORD_SIZE);
}

void LocationRecord::encode(ByteBuffer& out) const {
    out.appendUInt8(address);
    out.appendUInt8(headIndex);
    out.appendInt32(x);
    out.appendInt32(y);
    out.appendInt32(z);
    out.appendUInt8(statusFlag);
    out.appendUInt8(q);
    out.appendZeros(4);
}

bool LastLocationsRecord::decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::LAST_LOCATIONS_SIZE) {
        return false;
    }

    const std::uint8_t* cursor = data;
    for (auto& slot : slots) {
        slot = decodeLocation(cursor);
        cursor += config::LOCATION_RECORD_SIZE;
    }

    isNew = cursor[0] != 0;
    cursor += 1 + 5;

    const std::size_t payloadSize = cursor[0];
    cursor += 1;
    payload.assign(cursor, cursor + payloadSize);
    return true;
}

void LastLocationsRecord::encode(ByteBuffer& out) const {
    for (const auto& slot : slots) {
        slot.encode(out);
    }
    out.appendUInt8(isNew ? 1 : 0);
    out.appendZeros(5);

    const std::size_t payloadSize = std::min(payload.size(), config::LOCATION_PAYLOAD_SIZE - 1);
    out.appendUInt8(static_cast<std::uint8_t>(payloadSize));
    for (std::size_t i = 0; i < payloadSize; ++i) {
        out.appendUInt8(payload[i]);
    }
    out.appendZeros(config::LOCATION_PAYLOAD_SIZE - payloadSize);
}

} // namespace mmtrack::native

#pragma once

#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/native/ByteBuffer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mmtrack::native {

// One entry of the vendor devices list (9 packed bytes).
struct DeviceRecord {
    std::uint8_t address = 0;
    std::uint8_t isDuplicated = 0;
    std::uint8_t isSleeping = 0;
    std::uint8_t versionMajor = 0;
    std::uint8_t versionMinor = 0;
    std::uint8_t versionSecond = 0;
    std::uint8_t typeId = 0;
    std::uint8_t firmwareOption = 0;
    std::uint8_t flags = 0;

    void encode(ByteBuffer& out) const;
};

struct DevicesListRecord {
    std::vector<DeviceRecord> devices;

    /// Decodes `count` followed by the first `count` of 256 fixed slots.
    bool decode(const std::uint8_t* data, std::size_t size);
    void encode(ByteBuffer& out) const;
};

// One coordinate slot of the vendor last-locations record (20 packed bytes).
struct LocationRecord {
    std::uint8_t address = 0;          // 0 marks an empty slot
    std::uint8_t headIndex = 0;
    std::int32_t x = 0;                // millimetres
    std::int32_t y = 0;
    std::int32_t z = 0;
    std::uint8_t statusFlag = 0;
    std::uint8_t q = 0;

    bool isEmpty() const { return address == 0; }
    void encode(ByteBuffer& out) const;
};

struct LastLocationsRecord {
    std::array<LocationRecord, config::LOCATION_SLOTS> slots{};
    bool isNew = false;
    std::vector<std::uint8_t> payload;

    bool decode(const std::uint8_t* data, std::size_t size);
    void encode(ByteBuffer& out) const;
};

} // namespace mmtrack::native

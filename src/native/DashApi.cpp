#include "mmtrack/native/DashApi.hpp"

#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/log/Log.hpp"

#include <array>
#include <cstring>

#if defined(__GNUC__) && !defined(_WIN32)
#define MMTRACK_WEAK_IMPORT __attribute__((weak))
#else
#define MMTRACK_WEAK_IMPORT
#endif

// Vendor entry points. Every function fills a caller-owned buffer with packed
// little-endian data and returns false on failure.
extern "C" {
bool mm_get_last_error(void* pdata);
bool mm_api_version(void* pdata);
bool mm_open_port();
bool mm_open_port_by_name(void* pdata) MMTRACK_WEAK_IMPORT;
bool mm_close_port();
bool mm_get_devices_list(void* pdata);
bool mm_get_last_locations2(void* pdata);
}

namespace mmtrack {

namespace {

std::uint32_t read_le_u32(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0])
         | (static_cast<std::uint32_t>(data[1]) << 8)
         | (static_cast<std::uint32_t>(data[2]) << 16)
         | (static_cast<std::uint32_t>(data[3]) << 24);
}

// The vendor writes u32 results little-endian regardless of host order.
bool readU32(bool (*call)(void*), std::uint32_t& out) {
    std::array<std::uint8_t, 4> raw{};
    if (!call(raw.data())) {
        return false;
    }
    out = read_le_u32(raw.data());
    return true;
}

// Vendor record reads write a fixed number of bytes; never hand it a smaller buffer.
template <std::size_t RecordSize>
bool readRecord(bool (*call)(void*), std::uint8_t* buffer, std::size_t size) {
    if (!buffer || size < RecordSize) {
        logError("[DashApi] record buffer too small: ", size, " < ", RecordSize, "\n");
        return false;
    }
    return call(buffer);
}

} // namespace

bool DashApi::lastError(std::uint32_t& code) {
    return readU32(&mm_get_last_error, code);
}

bool DashApi::apiVersion(std::uint32_t& version) {
    return readU32(&mm_api_version, version);
}

bool DashApi::openPort() {
    return mm_open_port();
}

bool DashApi::openPortByName(const char* portName) {
    if (&mm_open_port_by_name == nullptr) {
        logError("[DashApi] installed dashapi cannot open a port by name\n");
        return false;
    }
    if (!portName) {
        return false;
    }
    // The vendor signature takes a mutable buffer.
    std::array<char, 256> name{};
    std::strncpy(name.data(), portName, name.size() - 1);
    return mm_open_port_by_name(name.data());
}

bool DashApi::closePort() {
    return mm_close_port();
}

bool DashApi::readDevicesList(std::uint8_t* buffer, std::size_t size) {
    return readRecord<config::DEVICES_LIST_SIZE>(&mm_get_devices_list, buffer, size);
}

bool DashApi::readLastLocations(std::uint8_t* buffer, std::size_t size) {
    return readRecord<config::LAST_LOCATIONS_SIZE>(&mm_get_last_locations2, buffer, size);
}

std::shared_ptr<NativeApi> defaultNativeApi() {
    static const std::shared_ptr<NativeApi> instance = std::make_shared<DashApi>();
    return instance;
}

} // namespace mmtrack

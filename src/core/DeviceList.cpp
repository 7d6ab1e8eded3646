#include "mmtrack/core/DeviceList.hpp"

#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/core/Connection.hpp"
#include "mmtrack/log/Log.hpp"

#include <array>
#include <utility>

namespace mmtrack {

DeviceList::DeviceList(std::vector<Device> devices)
: entries(std::move(devices))
{}

const Device* DeviceList::find(std::uint16_t address) const {
    for (const auto& device : entries) {
        if (device.address() == address) {
            return &device;
        }
    }
    return nullptr;
}

expected<std::size_t> DeviceList::updateLastLocations(const Connection& connection) {
    NativeApi* api = connection.native();
    if (!api) {
        logError("[DeviceList] updateLastLocations() on a closed connection\n");
        return unexpected(make_error_code(BindingError::NotConnected));
    }

    std::array<std::uint8_t, config::LAST_LOCATIONS_SIZE> raw{};
    const auto when = Device::Clock::now();
    if (!api->readLastLocations(raw.data(), raw.size())) {
        return unexpected(reportNativeFailure(*api, BindingError::NativeCallFailed, "read last locations"));
    }

    native::LastLocationsRecord record;
    if (!record.decode(raw.data(), raw.size())) {
        logError("[DeviceList] failed to decode last locations record\n");
        return unexpected(make_error_code(BindingError::InvalidEncoding));
    }

    return applyLocations(record, when);
}

std::size_t DeviceList::applyLocations(const native::LastLocationsRecord& record,
                                       Device::Clock::time_point when) {
    std::size_t refreshed = 0;
    for (auto& device : entries) {
        // Slots are in reporting order, so a later valid slot for the same address wins.
        bool applied = false;
        for (const auto& slot : record.slots) {
            if (slot.isEmpty() || slot.address != device.address()) {
                continue;
            }
            if (slot.q > config::QUALITY_MAX) {
                continue;
            }
            device.applyLocation(slot, when);
            applied = true;
        }
        if (applied) {
            ++refreshed;
        }
    }
    return refreshed;
}

} // namespace mmtrack

#pragma once

#include "mmtrack/core/Device.hpp"
#include "mmtrack/core/Expected.hpp"
#include "mmtrack/native/NativeRecords.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mmtrack {

class Connection;

/**
 * @brief Owned, ordered snapshot of the devices known to the modem.
 *
 * The list keeps no reference to the Connection it came from; refreshing
 * positions requires passing an open Connection to `updateLastLocations()`.
 * Duplicate addresses are kept as reported.
 */
class DeviceList {
public:
    DeviceList() = default;
    explicit DeviceList(std::vector<Device> devices);

    const std::vector<Device>& devices() const { return entries; }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    /// First device with the given address, or nullptr.
    const Device* find(std::uint16_t address) const;

    /**
     * @brief Read the vendor's latest locations and refresh matching devices in place.
     *
     * A device without a valid reading in this batch keeps its previous values
     * and is not counted.
     *
     * @return Number of devices refreshed.
     */
    expected<std::size_t> updateLastLocations(const Connection& connection);

    /**
     * @brief Merge step of updateLastLocations().
     *
     * Each device takes the last slot with its address and a quality of at
     * most 100; slots for addresses not in the list are ignored.
     *
     * @return Number of devices refreshed, each counted once.
     */
    std::size_t applyLocations(const native::LastLocationsRecord& record,
                               Device::Clock::time_point when);

private:
    std::vector<Device> entries;
};

} // namespace mmtrack

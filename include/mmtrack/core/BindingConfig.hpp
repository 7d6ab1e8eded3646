#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace mmtrack::config {

/**
 * @brief Constants that define how the binding drives the vendor library.
 *
 * Record sizes pin the packed little-endian layouts the vendor writes into
 * caller-supplied buffers; every decoder and the simulator use these.
 */

// Port handling ---------------------------------------------------------------
constexpr std::chrono::milliseconds OPEN_RETRY_INTERVAL{1};
constexpr std::chrono::seconds OPEN_TIMEOUT_DEFAULT{30};

// Location polling ------------------------------------------------------------
constexpr std::chrono::milliseconds POLL_INTERVAL_DEFAULT{1};
constexpr std::size_t POLL_MAX_CONSECUTIVE_FAILURES = 50;

// Native records --------------------------------------------------------------
constexpr std::size_t DEVICE_SLOTS = 256;
constexpr std::size_t DEVICE_RECORD_SIZE = 9;
constexpr std::size_t DEVICES_LIST_SIZE = 1 + DEVICE_SLOTS * DEVICE_RECORD_SIZE;   // 2305

constexpr std::size_t LOCATION_SLOTS = 6;
constexpr std::size_t LOCATION_RECORD_SIZE = 20;
constexpr std::size_t LOCATION_PAYLOAD_SIZE = 256;
constexpr std::size_t LAST_LOCATIONS_SIZE =
    LOCATION_SLOTS * LOCATION_RECORD_SIZE + 1 + 5 + 1 + LOCATION_PAYLOAD_SIZE;       // 383

constexpr std::uint8_t QUALITY_MAX = 100;       // readings above this are not valid fixes
constexpr std::uint8_t DEVICE_FLAG_CONNECTED = 0x01;

} // namespace mmtrack::config

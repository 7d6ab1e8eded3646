#pragma once

#include "mmtrack/core/BindingConfig.hpp"
#include "mmtrack/core/Connection.hpp"
#include "mmtrack/core/DeviceList.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace mmtrack {

struct PollerConfig {
    /// Delay between the end of one update and the start of the next.
    std::chrono::milliseconds interval = config::POLL_INTERVAL_DEFAULT;

    /// Failed updates in a row before the poller stops itself (0 = never).
    std::size_t maxConsecutiveFailures = config::POLL_MAX_CONSECUTIVE_FAILURES;
};

/**
 * @brief Called on the I/O thread with a copy of the list after each update
 *        that refreshed at least one device.
 *
 * The callback must not call `stop()` or destroy the poller it belongs to.
 */
using SnapshotCallback =
    std::function<void(const DeviceList& snapshot, std::size_t refreshed)>;

/**
 * @brief Periodically refreshes a DeviceList from the Connection it owns.
 *
 * Updates run on the shared `io::IoService` thread, serialised through a
 * strand, so the owned Connection is only ever used by one call at a time.
 * A NotConnected failure stops polling immediately; other failures stop it
 * after `maxConsecutiveFailures` in a row.
 */
class LocationPoller {
public:
    LocationPoller(Connection connection, DeviceList devices, PollerConfig config = {});
    ~LocationPoller();

    LocationPoller(const LocationPoller&) = delete;
    LocationPoller& operator=(const LocationPoller&) = delete;
    LocationPoller(LocationPoller&&) = delete;
    LocationPoller& operator=(LocationPoller&&) = delete;

    /// Install before `start()`.
    void setSnapshotCallback(SnapshotCallback callback);

    void start();

    /// Blocks until no update is in flight. Idempotent.
    void stop();

    bool isRunning() const;
    DeviceList snapshot() const;
    std::uint64_t updateCount() const;
    std::optional<std::error_code> lastError() const;

    /// Stops polling and releases the owned Connection.
    expected<void> close();

private:
    struct State;
    static void tick(const std::shared_ptr<State>& state);
    static void schedule(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state;
};

} // namespace mmtrack

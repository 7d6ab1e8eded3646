#include "mmtrack/core/LocationPoller.hpp"

#include "mmtrack/io/IoService.hpp"
#include "mmtrack/log/Log.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <utility>

namespace mmtrack {

namespace asio = io::asio;

struct LocationPoller::State {
    State(std::shared_ptr<asio::io_context> ioContext, Connection conn, DeviceList list, PollerConfig cfg)
    : context(std::move(ioContext))
    , strand(asio::make_strand(*context))
    , timer(strand)
    , connection(std::move(conn))
    , devices(std::move(list))
    , config(cfg)
    {}

    std::shared_ptr<asio::io_context> context;
    io::strand strand;
    io::steady_timer timer;

    mutable std::mutex mutex;
    Connection connection;
    DeviceList devices;
    PollerConfig config;
    SnapshotCallback callback;
    std::size_t consecutiveFailures = 0;
    std::uint64_t updates = 0;
    std::optional<std::error_code> lastFailure;

    std::atomic<bool> running{false};
};

LocationPoller::LocationPoller(Connection connection, DeviceList devices, PollerConfig config)
: state(std::make_shared<State>(io::shared_io_context(), std::move(connection), std::move(devices), config))
{}

LocationPoller::~LocationPoller() {
    if (auto result = close(); !result) {
        logError("[LocationPoller] release on destruction failed: ", result.error().message(), "\n");
    }
}

void LocationPoller::setSnapshotCallback(SnapshotCallback callback) {
    std::lock_guard lock(state->mutex);
    state->callback = std::move(callback);
}

void LocationPoller::start() {
    if (state->running.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(state->mutex);
        state->consecutiveFailures = 0;
        state->lastFailure.reset();
    }
    logInfo("[LocationPoller] start, interval ", state->config.interval.count(), "ms\n");
    asio::post(state->strand, [s = state] { tick(s); });
}

void LocationPoller::stop() {
    const bool wasRunning = state->running.exchange(false);

    if (state->strand.running_in_this_thread()) {
        state->timer.cancel();
        return;
    }

    // Anything already queued on the strand finishes before this task runs.
    std::promise<void> drained;
    auto done = drained.get_future();
    asio::post(state->strand, [s = state, &drained] {
        s->timer.cancel();
        drained.set_value();
    });
    done.wait();

    if (wasRunning) {
        logInfo("[LocationPoller] stop()\n");
    }
}

bool LocationPoller::isRunning() const {
    return state->running.load();
}

DeviceList LocationPoller::snapshot() const {
    std::lock_guard lock(state->mutex);
    return state->devices;
}

std::uint64_t LocationPoller::updateCount() const {
    std::lock_guard lock(state->mutex);
    return state->updates;
}

std::optional<std::error_code> LocationPoller::lastError() const {
    std::lock_guard lock(state->mutex);
    return state->lastFailure;
}

expected<void> LocationPoller::close() {
    stop();
    std::lock_guard lock(state->mutex);
    return state->connection.close();
}

void LocationPoller::tick(const std::shared_ptr<State>& s) {
    if (!s->running) {
        return;
    }

    SnapshotCallback callback;
    std::optional<DeviceList> delivered;
    std::size_t refreshed = 0;
    {
        std::lock_guard lock(s->mutex);
        auto result = s->devices.updateLastLocations(s->connection);
        if (result) {
            ++s->updates;
            s->consecutiveFailures = 0;
            refreshed = *result;
            if (refreshed > 0 && s->callback) {
                callback = s->callback;
                delivered = s->devices;
            }
        } else {
            ++s->consecutiveFailures;
            s->lastFailure = result.error();
            const bool fatal = result.error() == BindingError::NotConnected;
            const auto limit = s->config.maxConsecutiveFailures;
            if (fatal || (limit > 0 && s->consecutiveFailures >= limit)) {
                logError("[LocationPoller] stopping after ", s->consecutiveFailures,
                         " failed update(s): ", result.error().message(), "\n");
                s->running = false;
            }
        }
    }

    if (callback && delivered) {
        callback(*delivered, refreshed);
    }

    schedule(s);
}

void LocationPoller::schedule(const std::shared_ptr<State>& s) {
    if (!s->running) {
        return;
    }
    s->timer.expires_after(s->config.interval);
    s->timer.async_wait([s](const std::error_code& ec) {
        if (ec) {
            return; // cancelled by stop()
        }
        tick(s);
    });
}

} // namespace mmtrack

#include "mmtrack/core/Binding.hpp"
#include "mmtrack/core/Dummy/DummyDashApi.hpp"
#include "mmtrack/core/LocationPoller.hpp"
#include "mmtrack/log/Log.hpp"
#if defined(MMTRACK_HAVE_DASHAPI)
#include "mmtrack/native/DashApi.hpp"
#endif

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

using namespace mmtrack;

namespace {

struct Options {
    bool simulate = false;
    std::chrono::seconds timeout = config::OPEN_TIMEOUT_DEFAULT;
    std::optional<std::string> port;
    std::optional<std::string> csvPath;
    std::uint16_t recordAddress = 0;
    std::chrono::seconds duration{30};
    std::chrono::milliseconds interval = config::POLL_INTERVAL_DEFAULT;
};

void printUsage() {
    std::cout <<
        "usage: mmtrack_logger [--simulate] [--timeout <s>] [--port <name>]\n"
        "                      [--csv <path>] [--address <n>] [--duration <s>]\n"
        "                      [--interval-ms <n>]\n";
}

std::optional<long long> parseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const std::string copy(text);
    const long long value = std::strtoll(copy.c_str(), &end, 10);
    if (end == copy.c_str() || *end != '\0' || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--simulate") {
            options.simulate = true;
            continue;
        }
        if (arg == "--help" || arg == "-h" || !hasValue) {
            return std::nullopt;
        }

        const std::string_view value = argv[++i];
        if (arg == "--port") {
            options.port = std::string(value);
        } else if (arg == "--csv") {
            options.csvPath = std::string(value);
        } else {
            const auto number = parseNumber(value);
            if (!number) {
                std::cerr << "invalid value for " << arg << ": " << value << "\n";
                return std::nullopt;
            }
            if (arg == "--timeout") {
                options.timeout = std::chrono::seconds{*number};
            } else if (arg == "--address") {
                options.recordAddress = static_cast<std::uint16_t>(*number);
            } else if (arg == "--duration") {
                options.duration = std::chrono::seconds{*number};
            } else if (arg == "--interval-ms") {
                options.interval = std::chrono::milliseconds{*number};
            } else {
                std::cerr << "unknown option " << arg << "\n";
                return std::nullopt;
            }
        }
    }
    return options;
}

std::shared_ptr<NativeApi> makeSimulation() {
    auto sim = std::make_shared<dummy::DummyDashApi>();
    // Four stationary beacons on a 4 m square plus two hedgehogs.
    const std::int32_t corners[4][2] = {{0, 0}, {4000, 0}, {4000, 4000}, {0, 4000}};
    for (std::uint8_t i = 0; i < 4; ++i) {
        const auto address = static_cast<std::uint8_t>(i + 1);
        sim->addDevice(address, 30);
        sim->setLocation(address, corners[i][0], corners[i][1], 2000, 100);
    }
    sim->addDevice(11, 31);
    sim->setLocation(11, 1500, 0, 300, 90);
    sim->addDevice(12, 31);
    sim->setLocation(12, 0, 1500, 300, 75);
    sim->setMotion(true);
    return sim;
}

// Prints fresh readings and appends the recorded address to the CSV file.
class LocationRecorder {
public:
    LocationRecorder(std::optional<std::string> csvPath, std::uint16_t recordAddress)
    : address(recordAddress) {
        if (csvPath) {
            csv.open(*csvPath, std::ios::out | std::ios::trunc);
            if (!csv) {
                logError("[mmtrack_logger] cannot open ", *csvPath, " for writing\n");
            } else {
                csv << "address;x;y;z;q;t\n";
            }
        }
    }

    void onSnapshot(const DeviceList& snapshot) {
        std::lock_guard lock(mutex);
        for (const auto& device : snapshot.devices()) {
            if (!device.hasLocation()) {
                continue;
            }
            auto& previous = lastSeen[device.address()];
            if (device.updateTime() <= previous) {
                continue;
            }
            previous = device.updateTime();

            if (device.q() > 0) {
                std::ostringstream line;
                line << "address #" << std::setw(3) << std::setfill('0') << device.address()
                     << std::setfill(' ') << std::fixed << std::setprecision(3)
                     << " x " << device.x() / 1000.0
                     << " y " << device.y() / 1000.0
                     << " z " << device.z() / 1000.0
                     << " q " << static_cast<int>(device.q()) << "\n";
                logInfo(line.str());
            }

            if (csv && device.address() == address) {
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    device.updateTime().time_since_epoch()).count();
                csv << device.address() << ';' << device.x() << ';' << device.y() << ';'
                    << device.z() << ';' << static_cast<int>(device.q()) << ';' << millis << '\n';
            }
        }
    }

private:
    std::mutex mutex;
    std::ofstream csv;
    std::uint16_t address;
    std::map<std::uint16_t, Device::Clock::time_point> lastSeen;
};

std::shared_ptr<NativeApi> hardwareLibrary() {
#if defined(MMTRACK_HAVE_DASHAPI)
    return defaultNativeApi();
#else
    logError("mmtrack_logger was built without the dashapi library; only --simulate is available\n");
    return nullptr;
#endif
}

} // namespace

int main(int argc, char** argv) {
    const auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage();
        return 2;
    }

    auto library = options->simulate ? makeSimulation() : hardwareLibrary();
    if (!library) {
        return 1;
    }

    auto version = apiVersion(*library);
    if (!version) {
        std::cerr << "api version failed: " << version.error().message() << "\n";
        return 1;
    }
    std::cout << "api version: " << version->toString() << "\n";

    PortOptions portOptions;
    portOptions.timeout = options->timeout;
    portOptions.portName = options->port;

    auto connection = openPort(library, portOptions);
    if (!connection) {
        std::cerr << "open port failed: " << connection.error().message() << "\n";
        return 1;
    }
    std::cout << "open port successfully\n";

    auto devices = getDeviceList(*connection);
    if (!devices) {
        std::cerr << "device list failed: " << devices.error().message() << "\n";
        return 1;
    }
    for (const auto& device : devices->devices()) {
        std::cout << device.describe() << "\n";
    }

    LocationRecorder recorder(options->csvPath, options->recordAddress);

    PollerConfig pollerConfig;
    pollerConfig.interval = options->interval;
    LocationPoller poller(std::move(*connection), std::move(*devices), pollerConfig);
    poller.setSnapshotCallback([&recorder](const DeviceList& snapshot, std::size_t) {
        recorder.onSnapshot(snapshot);
    });
    poller.start();

    const auto deadline = std::chrono::steady_clock::now() + options->duration;
    while (poller.isRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    const bool stoppedOnFailure = !poller.isRunning() && poller.lastError().has_value();
    if (auto closed = poller.close(); !closed) {
        std::cerr << "close port failed: " << closed.error().message() << "\n";
        return 1;
    }

    std::cout << "Done after " << poller.updateCount() << " update(s).\n";
    return stoppedOnFailure ? 1 : 0;
}

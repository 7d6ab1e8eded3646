#include "mmtrack/core/Binding.hpp"
#include "mmtrack/core/Dummy/DummyDashApi.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>

using namespace std::chrono_literals;

#define ASSERT_TRUE(cond, msg) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "ASSERT TRUE FAILED: %s @ %s:%d\n", msg, __FILE__, __LINE__); \
            std::exit(1); \
        } \
    } while (0)

int main() {
    auto sim = std::make_shared<mmtrack::dummy::DummyDashApi>();
    for (std::uint8_t address = 1; address <= 3; ++address) {
        sim->addDevice(address);
        sim->setLocation(address, address * 1000, address * -250, 300, static_cast<std::uint8_t>(70 + address));
    }

    auto connection = mmtrack::openPort(sim, 30s);
    ASSERT_TRUE(connection.has_value(), "openPort(30s) succeeds");

    auto list = mmtrack::getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "device list");
    ASSERT_TRUE(list->size() == 3, "three devices");
    for (std::uint16_t address = 1; address <= 3; ++address) {
        const auto* device = list->find(address);
        ASSERT_TRUE(device != nullptr, "address listed");
        ASSERT_TRUE(!device->hasLocation(), "placeholder before update");
        ASSERT_TRUE(device->x() == 0 && device->y() == 0 && device->z() == 0 && device->q() == 0,
                    "placeholder values are zero");
    }

    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(updated.has_value(), "update succeeds");
    ASSERT_TRUE(*updated == 3, "three devices refreshed");
    for (const auto& device : list->devices()) {
        ASSERT_TRUE(device.hasLocation(), "located");
        ASSERT_TRUE(device.x() == device.address() * 1000, "x from vendor");
        ASSERT_TRUE(device.y() == device.address() * -250, "negative y from vendor");
        ASSERT_TRUE(device.q() == 70 + device.address(), "q from vendor");
    }

    ASSERT_TRUE(connection->close().has_value(), "close succeeds");
    auto afterClose = mmtrack::getDeviceList(*connection);
    ASSERT_TRUE(!afterClose, "device list after close fails");
    ASSERT_TRUE(afterClose.error() == mmtrack::BindingError::NotConnected, "NotConnected after close");
    ASSERT_TRUE(sim->closeCalls() == 1, "vendor port closed once");

    std::puts("End-to-end binding test passed.");
    return 0;
}

#include "mmtrack/core/Binding.hpp"
#include "mmtrack/core/Dummy/DummyDashApi.hpp"
#include "mmtrack/log/Log.hpp"

#include <chrono>
#include <memory>

using namespace mmtrack;
using namespace std::chrono_literals;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { mmtrack::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { mmtrack::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::shared_ptr<dummy::DummyDashApi> makeFleet() {
    auto sim = std::make_shared<dummy::DummyDashApi>();
    sim->addDevice(1);
    sim->addDevice(2);
    sim->addDevice(3);
    sim->setLocation(1, 1000, 2000, 3000, 80);
    sim->setLocation(2, -500, 750, 100, 60);
    sim->setLocation(3, 4000, 0, 2000, 100);
    return sim;
}

static void testUnitConversion() {
    const Device device(5, 1000, 2000, 3000, 80);
    ASSERT_EQ(device.address(), std::uint16_t{5}, "address");
    ASSERT_TRUE(device.x() / 1000.0 == 1.0, "x converts to 1 m");
    ASSERT_TRUE(device.y() / 1000.0 == 2.0, "y converts to 2 m");
    ASSERT_TRUE(device.z() / 1000.0 == 3.0, "z converts to 3 m");
    ASSERT_EQ(device.q(), std::uint8_t{80}, "quality");
    ASSERT_TRUE(device.hasLocation(), "constructed with a location");
}

static void testPartialFailureIsSkipped() {
    auto sim = makeFleet();
    auto connection = openPort(sim, 0s);
    ASSERT_TRUE(connection.has_value(), "open");
    auto list = getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "device list");

    auto first = list->updateLastLocations(*connection);
    ASSERT_TRUE(first.has_value(), "first update");
    ASSERT_EQ(*first, std::size_t{3}, "all three refreshed");

    const auto before = *list->find(2);
    sim->setResolved(2, false);
    sim->setLocation(1, 1100, 2100, 3100, 81);
    sim->setLocation(2, 9999, 9999, 9999, 99);

    auto second = list->updateLastLocations(*connection);
    ASSERT_TRUE(second.has_value(), "partial failure does not fail the call");
    ASSERT_EQ(*second, std::size_t{2}, "unresolved device not counted");

    const Device* device2 = list->find(2);
    ASSERT_TRUE(device2 != nullptr, "device 2 still listed");
    ASSERT_EQ(device2->x(), before.x(), "device 2 x unchanged");
    ASSERT_EQ(device2->y(), before.y(), "device 2 y unchanged");
    ASSERT_EQ(device2->z(), before.z(), "device 2 z unchanged");
    ASSERT_EQ(device2->q(), before.q(), "device 2 q unchanged");
    ASSERT_TRUE(device2->updateTime() == before.updateTime(), "device 2 update time unchanged");
    ASSERT_EQ(list->find(1)->x(), 1100, "device 1 refreshed");
}

static void testUnresolvedBeforeFirstFix() {
    auto sim = makeFleet();
    sim->setResolved(2, false);
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "device list");

    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(updated.has_value(), "update");
    ASSERT_EQ(*updated, std::size_t{2}, "two of three refreshed");
    ASSERT_TRUE(!list->find(2)->hasLocation(), "unresolved device keeps placeholder");
    ASSERT_EQ(list->find(2)->x(), 0, "placeholder x stays zero");
}

static void testQualityOutOfRangeIsSkipped() {
    auto sim = makeFleet();
    sim->setLocation(3, 1, 1, 1, 101);
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);

    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(updated.has_value(), "update");
    ASSERT_EQ(*updated, std::size_t{2}, "q > 100 is not a valid fix");
    ASSERT_TRUE(!list->find(3)->hasLocation(), "device 3 not refreshed");
}

static void testListUnreadable() {
    auto sim = makeFleet();
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "device list");

    sim->setLocationsFailure(true);
    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(!updated && updated.error() == BindingError::NativeCallFailed,
                "unreadable locations fail the whole call");
    ASSERT_TRUE(!list->find(1)->hasLocation(), "failed call leaves devices untouched");

    sim->setDevicesListFailure(true);
    auto relisted = getDeviceList(*connection);
    ASSERT_TRUE(!relisted && relisted.error() == BindingError::NativeCallFailed,
                "unreadable devices list fails");
}

static void testLastValidSlotWins() {
    DeviceList list({Device(7, 0, 0, 0, 0), Device(8, 5, 5, 5, 5)});

    native::LastLocationsRecord record;
    record.slots[0].address = 7;
    record.slots[0].x = 100;
    record.slots[0].q = 50;
    record.slots[1].address = 7;
    record.slots[1].x = 200;
    record.slots[1].q = 60;
    record.slots[2].address = 7;
    record.slots[2].x = 300;
    record.slots[2].q = 101;
    record.slots[3].address = 9;
    record.slots[3].x = 900;
    record.slots[3].q = 10;

    const auto refreshed = list.applyLocations(record, Device::Clock::now());
    ASSERT_EQ(refreshed, std::size_t{1}, "device 7 counted once");
    ASSERT_EQ(list.find(7)->x(), 200, "later valid slot wins");
    ASSERT_EQ(list.find(7)->q(), std::uint8_t{60}, "quality from the later slot");
    ASSERT_EQ(list.find(8)->x(), 5, "device without a slot untouched");
    ASSERT_EQ(list.size(), std::size_t{2}, "unknown address not appended");
}

static void testTimedOutReadIsTimeout() {
    auto sim = makeFleet();
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "device list");

    sim->setLocationsTimeout(true);
    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(!updated && updated.error() == BindingError::Timeout,
                "backend timeout surfaces as Timeout");

    sim->setLocationsTimeout(false);
    sim->setLocationsFailure(true);
    auto failed = list->updateLastLocations(*connection);
    ASSERT_TRUE(!failed && failed.error() == BindingError::NativeCallFailed,
                "ordinary failure after a timeout is NativeCallFailed");
}

static void testDuplicateAddressesTolerated() {
    auto sim = std::make_shared<dummy::DummyDashApi>();
    native::DeviceRecord dup;
    dup.address = 4;
    dup.isDuplicated = 1;
    dup.typeId = 31;
    sim->addDevice(dup);
    sim->addDevice(dup);
    sim->setLocation(4, 10, 20, 30, 50);

    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);
    ASSERT_TRUE(list.has_value(), "duplicates are not rejected");
    ASSERT_EQ(list->size(), std::size_t{2}, "both entries kept");
    ASSERT_TRUE(list->devices()[0].isDuplicated(), "duplicate flag carried");

    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(updated.has_value(), "update");
    ASSERT_EQ(*updated, std::size_t{2}, "each duplicate refreshed from the shared slot");
    ASSERT_EQ(list->devices()[1].z(), 30, "second duplicate has the location");
}

static void testLargeFleetRoundRobin() {
    auto sim = std::make_shared<dummy::DummyDashApi>();
    for (std::uint8_t address = 1; address <= 8; ++address) {
        sim->addDevice(address);
        sim->setLocation(address, address * 100, 0, 0, 90);
    }
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);

    auto first = list->updateLastLocations(*connection);
    ASSERT_TRUE(first.has_value(), "first batch");
    ASSERT_EQ(*first, std::size_t{6}, "six slots per vendor read");
    auto second = list->updateLastLocations(*connection);
    ASSERT_TRUE(second.has_value(), "second batch");

    std::size_t located = 0;
    for (const auto& device : list->devices()) {
        located += device.hasLocation() ? 1 : 0;
    }
    ASSERT_EQ(located, std::size_t{8}, "whole fleet located after two reads");
}

static void testSnapshotsAreIndependent() {
    auto sim = makeFleet();
    auto connection = openPort(sim, 0s);
    auto list = getDeviceList(*connection);
    const DeviceList frozen = *list;

    auto updated = list->updateLastLocations(*connection);
    ASSERT_TRUE(updated.has_value(), "update");
    ASSERT_TRUE(!frozen.find(1)->hasLocation(), "copied snapshot unaffected by update");

    ASSERT_TRUE(connection->close().has_value(), "close");
    ASSERT_EQ(list->find(3)->x(), 4000, "fetched positions readable after close");
    ASSERT_TRUE(list->find(42) == nullptr, "missing address");
}

int main() {
    testUnitConversion();
    testPartialFailureIsSkipped();
    testUnresolvedBeforeFirstFix();
    testQualityOutOfRangeIsSkipped();
    testListUnreadable();
    testLastValidSlotWins();
    testTimedOutReadIsTimeout();
    testDuplicateAddressesTolerated();
    testLargeFleetRoundRobin();
    testSnapshotsAreIndependent();

    if (g_failures) {
        mmtrack::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    mmtrack::logInfo("Device list update tests passed.\n");
    return 0;
}

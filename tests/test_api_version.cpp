#include "mmtrack/core/Binding.hpp"
#include "mmtrack/core/Dummy/DummyDashApi.hpp"
#include "mmtrack/log/Log.hpp"

#include <string>

using namespace mmtrack;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { mmtrack::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testVersionReported() {
    dummy::DummyDashApi sim;
    sim.setApiVersion(9);
    auto version = apiVersion(sim);
    ASSERT_TRUE(version.has_value(), "version query succeeds without an open port");
    ASSERT_TRUE(version->value == 9u, "raw version");
    ASSERT_TRUE(version->toString() == "9", "version text");
}

static void testVersionFailure() {
    dummy::DummyDashApi sim;
    sim.setVersionFailure(true, dummy::DummyDashApi::ERROR_LICENSE);
    auto version = apiVersion(sim);
    ASSERT_TRUE(!version, "failed vendor call is not reported as a version");
    ASSERT_TRUE(version.error() == BindingError::NativeCallFailed, "maps to NativeCallFailed");
    ASSERT_TRUE(lastNativeError(sim) == NativeError::License, "vendor license error classified");
}

static void testZeroVersionRejected() {
    dummy::DummyDashApi sim;
    sim.setApiVersion(0);
    auto version = apiVersion(sim);
    ASSERT_TRUE(!version && version.error() == BindingError::InvalidEncoding,
                "version 0 is never reported as valid");
}

static void testErrorCategory() {
    const std::error_code ec = BindingError::PortUnavailable;
    ASSERT_TRUE(ec.category().name() == std::string("mmtrack.binding"), "category name");
    ASSERT_TRUE(ec.message() == "port unavailable", "category message");
    ASSERT_TRUE(ec != std::error_code(BindingError::NotConnected), "kinds are distinct");
    ASSERT_TRUE(classifyNativeError(2) == NativeError::SerialPort, "vendor code 2");
    ASSERT_TRUE(classifyNativeError(77) == NativeError::Unknown, "unlisted vendor code");
}

int main() {
    testVersionReported();
    testVersionFailure();
    testZeroVersionRejected();
    testErrorCategory();

    if (g_failures) {
        mmtrack::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    mmtrack::logInfo("API version tests passed.\n");
    return 0;
}

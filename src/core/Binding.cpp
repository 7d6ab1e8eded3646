#include "mmtrack/core/Binding.hpp"

#include "mmtrack/log/Log.hpp"
#include "mmtrack/native/NativeRecords.hpp"

#include <cctype>
#include <thread>
#include <utility>
#include <vector>

namespace mmtrack {

namespace {

constexpr std::string_view kAutoPort = "auto";

#if defined(_WIN32)
bool isComName(std::string_view name) {
    if (name.size() < 4) {
        return false;
    }
    const auto upper = [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); };
    if (upper(name[0]) != 'C' || upper(name[1]) != 'O' || upper(name[2]) != 'M') {
        return false;
    }
    for (std::size_t i = 3; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}
#endif

bool attemptOpen(NativeApi& api, const PortOptions& options) {
    if (options.portName) {
        return api.openPortByName(options.portName->c_str());
    }
    return api.openPort();
}

} // namespace

std::string ApiVersion::toString() const {
    return std::to_string(value);
}

bool isSupportedPortName(std::string_view name) {
#if defined(_WIN32)
    constexpr std::string_view devicePrefix = "\\\\.\\";
    if (name.substr(0, devicePrefix.size()) == devicePrefix) {
        name.remove_prefix(devicePrefix.size());
    }
    return isComName(name);
#else
    constexpr std::string_view devicePrefix = "/dev/";
    return name.size() > devicePrefix.size()
        && name.substr(0, devicePrefix.size()) == devicePrefix;
#endif
}

expected<ApiVersion> apiVersion(NativeApi& api) {
    std::uint32_t version = 0;
    if (!api.apiVersion(version)) {
        return unexpected(reportNativeFailure(api, BindingError::NativeCallFailed, "api version"));
    }
    if (version == 0) {
        logError("[Binding] vendor library reported API version 0\n");
        return unexpected(make_error_code(BindingError::InvalidEncoding));
    }
    return ApiVersion{version};
}

expected<Connection> openPort(std::shared_ptr<NativeApi> api, const PortOptions& options) {
    if (!api) {
        logError("[Binding] openPort() without a native library\n");
        return unexpected(make_error_code(BindingError::PortUnavailable));
    }

    const std::string portName = options.portName ? *options.portName : std::string{kAutoPort};
    if (options.portName && !isSupportedPortName(*options.portName)) {
        logError("[Binding] unsupported port name '", portName, "'\n");
        return unexpected(make_error_code(BindingError::PortUnavailable));
    }

    if (!api->tryClaimPort()) {
        logError("[Binding] port already open on this native library\n");
        return unexpected(make_error_code(BindingError::PortUnavailable));
    }

    const auto timeout = options.timeout.count() < 0 ? std::chrono::seconds{0} : options.timeout;
    const auto start = std::chrono::steady_clock::now();
    std::size_t attempts = 0;

    for (;;) {
        ++attempts;
        if (attemptOpen(*api, options)) {
            logInfo("[Binding] opened port ", portName, " after ", attempts, " attempt(s)\n");
            return Connection(std::move(api), portName);
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            break;
        }
        std::this_thread::sleep_for(config::OPEN_RETRY_INTERVAL);
    }

    api->releasePort();
    logError("[Binding] giving up on port ", portName, " after ", attempts,
             " attempt(s) in ", timeout.count(), "s\n");
    const auto ec = reportNativeFailure(*api, BindingError::PortUnavailable, "open port");
    return unexpected(ec);
}

expected<Connection> openPort(std::shared_ptr<NativeApi> api, std::chrono::seconds timeout) {
    PortOptions options;
    options.timeout = timeout;
    return openPort(std::move(api), options);
}

expected<Connection> openPort(std::shared_ptr<NativeApi> api) {
    return openPort(std::move(api), PortOptions{});
}

expected<DeviceList> getDeviceList(const Connection& connection) {
    NativeApi* api = connection.native();
    if (!api) {
        logError("[Binding] getDeviceList() on a closed connection\n");
        return unexpected(make_error_code(BindingError::NotConnected));
    }

    std::vector<std::uint8_t> raw(config::DEVICES_LIST_SIZE, 0);
    const auto listedAt = Device::Clock::now();
    if (!api->readDevicesList(raw.data(), raw.size())) {
        return unexpected(reportNativeFailure(*api, BindingError::NativeCallFailed, "read devices list"));
    }

    native::DevicesListRecord record;
    if (!record.decode(raw.data(), raw.size())) {
        logError("[Binding] failed to decode devices list\n");
        return unexpected(make_error_code(BindingError::InvalidEncoding));
    }

    std::vector<Device> devices;
    devices.reserve(record.devices.size());
    for (const auto& entry : record.devices) {
        Device device = Device::fromRecord(entry, listedAt);
        if (device.type() == DeviceType::Unknown) {
            logInfo("[Binding] device #", static_cast<int>(entry.address),
                    " has unrecognised type id ", static_cast<int>(entry.typeId), "\n");
        }
        devices.push_back(std::move(device));
    }

    logInfo("[Binding] ", devices.size(), " device(s) known to modem\n");
    return DeviceList(std::move(devices));
}

} // namespace mmtrack

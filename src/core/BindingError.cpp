#include "mmtrack/core/BindingError.hpp"

namespace mmtrack {

namespace {

class BindingCategory final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "mmtrack.binding";
    }

    std::string message(int value) const override {
        switch (static_cast<BindingError>(value)) {
            case BindingError::NotConnected:     return "connection is not open";
            case BindingError::PortUnavailable:  return "port unavailable";
            case BindingError::NativeCallFailed: return "native call failed";
            case BindingError::InvalidEncoding:  return "invalid native encoding";
            case BindingError::Timeout:          return "native call timed out";
        }
        return "unknown binding error";
    }
};

} // namespace

const std::error_category& bindingCategory() noexcept {
    static const BindingCategory category;
    return category;
}

std::error_code make_error_code(BindingError error) noexcept {
    return {static_cast<int>(error), bindingCategory()};
}

NativeError classifyNativeError(std::uint32_t vendorCode) noexcept {
    switch (vendorCode) {
        case 0:    return NativeError::None;
        case 1:    return NativeError::Communication;
        case 2:    return NativeError::SerialPort;
        case 3:    return NativeError::License;
        default:   return NativeError::Unknown;
    }
}

const char* toString(NativeError error) noexcept {
    switch (error) {
        case NativeError::None:          return "none";
        case NativeError::Communication: return "communication error";
        case NativeError::SerialPort:    return "error opening serial port";
        case NativeError::License:       return "license is required";
        case NativeError::Unknown:       return "unknown error";
    }
    return "unknown error";
}

} // namespace mmtrack

#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

namespace mmtrack {

/**
 * @brief Failure kinds surfaced by every fallible binding call.
 *
 * Values are registered as a `std::error_code` enum, so results can be
 * compared directly: `if (r.error() == BindingError::NotConnected) ...`.
 */
enum class BindingError {
    NotConnected = 1,     ///< Query against a closed or never-opened Connection.
    PortUnavailable,      ///< The native open call failed or the port is already claimed.
    NativeCallFailed,     ///< A native call returned its failure flag.
    InvalidEncoding,      ///< A native value could not be interpreted.
    Timeout               ///< The backend reported that a read timed out.
};

const std::error_category& bindingCategory() noexcept;

std::error_code make_error_code(BindingError error) noexcept;

/**
 * @brief Classification of the vendor's "last error" code.
 *
 * Logged alongside binding failures for diagnostics; it never replaces the
 * BindingError kind. Codes other than 1-3 are Unknown.
 */
enum class NativeError : std::uint8_t {
    None = 0,
    Communication = 1,
    SerialPort = 2,
    License = 3,
    Unknown = 0xFE
};

NativeError classifyNativeError(std::uint32_t vendorCode) noexcept;
const char* toString(NativeError error) noexcept;

} // namespace mmtrack

namespace std {
template <>
struct is_error_code_enum<mmtrack::BindingError> : true_type {};
} // namespace std

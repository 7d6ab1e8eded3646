#include "mmtrack/native/NativeApi.hpp"

#include "mmtrack/log/Log.hpp"

namespace mmtrack {

bool NativeApi::tryClaimPort() noexcept {
    bool unclaimed = false;
    return claimed.compare_exchange_strong(unclaimed, true);
}

void NativeApi::releasePort() noexcept {
    claimed.store(false);
}

bool NativeApi::portClaimed() const noexcept {
    return claimed.load();
}

NativeError lastNativeError(NativeApi& api) {
    std::uint32_t code = 0;
    if (!api.lastError(code)) {
        return NativeError::Unknown;
    }
    return classifyNativeError(code);
}

std::error_code reportNativeFailure(NativeApi& api, BindingError kind, std::string_view where) {
    const NativeError vendor = lastNativeError(api);
    const bool timedOut = kind == BindingError::NativeCallFailed && api.lastCallTimedOut();
    const BindingError reported = timedOut ? BindingError::Timeout : kind;
    const std::error_code ec = make_error_code(reported);
    logError("[NativeApi] ", where, " failed: ", ec.message(),
             " (vendor: ", toString(vendor), ")\n");
    return ec;
}

} // namespace mmtrack

#pragma once

#include <stdexcept>
#include <string>

namespace vani {

enum class ErrorCode {
    AuthFailure,
    UnknownProvider,
    UpstreamUnavailable,
    Timeout,
    TranscodeFailure,
    QuotaExceeded,
    DeliveryFailure,
    InvalidConfiguration
};

/// Stable wire code used in device-facing "error" messages.
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Session-fatal failure raised by bridge components
 *
 * Per-frame and delivery failures are reported through return values instead.
 */
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class ProviderError : public BridgeError {
public:
    ProviderError(ErrorCode code, const std::string& provider, const std::string& message)
        : BridgeError(code, provider + ": " + message), provider_(provider) {}

    const std::string& provider() const noexcept { return provider_; }

private:
    std::string provider_;
};

} // namespace vani

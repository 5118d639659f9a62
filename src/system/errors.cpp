#include "system/errors.hpp"

namespace vani {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthFailure: return "AUTH_FAILURE";
        case ErrorCode::UnknownProvider: return "UNKNOWN_PROVIDER";
        case ErrorCode::UpstreamUnavailable: return "UPSTREAM_UNAVAILABLE";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::TranscodeFailure: return "TRANSCODE_FAILURE";
        case ErrorCode::QuotaExceeded: return "QUOTA_EXCEEDED";
        case ErrorCode::DeliveryFailure: return "DELIVERY_FAILURE";
        case ErrorCode::InvalidConfiguration: return "INVALID_CONFIGURATION";
    }
    return "UNKNOWN";
}

} // namespace vani

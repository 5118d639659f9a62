#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "system/errors.hpp"

namespace vani::network::protocol {

// "server" message signals
enum class ServerSignal {
    ResponseCreated,
    ResponseComplete,
    SessionCreated,
    SessionEnd,
    ResponseError
};

const char* serverSignalToString(ServerSignal signal);

struct AuthPayload {
    int volume = 20;
    bool isOta = false;
    bool isReset = false;
    double pitchFactor = 1.0;
    std::optional<std::string> selectedAssetId;
    std::string playbackStatus = "stopped";
};

nlohmann::json makeAuthMessage(const AuthPayload& payload);
nlohmann::json makeServerMessage(ServerSignal signal, std::optional<int> volume = std::nullopt);
nlohmann::json makeErrorMessage(ErrorCode code, const std::string& message);
nlohmann::json makePlaybackStatus(const std::string& status, const std::optional<std::string>& assetId);
nlohmann::json makeDeviceCommand(const std::string& command,
                                 const std::optional<std::string>& assetId,
                                 const std::optional<std::string>& url);

/// UTC timestamp, e.g. 2024-05-01T12:00:00.000Z
std::string isoTimestampNow();

// Instructions and actions a device may send
namespace instruction {
constexpr const char* INTERRUPT = "INTERRUPT";
constexpr const char* END_SESSION = "END_SESSION";
constexpr const char* END_OF_SPEECH = "end_of_speech";
} // namespace instruction

struct DeviceMessage {
    enum class Kind {
        Instruction,
        Action,
        PlaybackStatus,
        Unknown,
        Invalid
    };

    Kind kind = Kind::Invalid;
    std::string type;
    std::string instruction;     // Instruction: msg field
    std::string action;          // Action: play / pause / stop / resume
    std::optional<std::string> assetId;
    std::optional<std::string> url;
    std::string status;          // PlaybackStatus
    double position = 0.0;
};

/// Never throws; malformed JSON yields Kind::Invalid.
DeviceMessage parseDeviceMessage(const std::string& text);

} // namespace vani::network::protocol

#include "network/device_protocol.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vani::network::protocol {

using json = nlohmann::json;

namespace {

std::optional<std::string> idField(const json& message, const char* key) {
    auto it = message.find(key);
    if (it == message.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    return std::nullopt;
}

void parseFields(const json& message, DeviceMessage& result) {
    if (result.type == "instruction") {
        result.kind = DeviceMessage::Kind::Instruction;
        result.instruction = message.value("msg", "");
    } else if (result.type == "action") {
        result.kind = DeviceMessage::Kind::Action;
        result.action = message.value("action", "");
        result.assetId = idField(message, "bhajan_id");
        if (!result.assetId) {
            result.assetId = idField(message, "asset_id");
        }
        result.url = idField(message, "url");
    } else if (result.type == "bhajan_status") {
        result.kind = DeviceMessage::Kind::PlaybackStatus;
        result.status = message.value("status", "");
        auto position = message.find("position");
        if (position != message.end() && position->is_number()) {
            result.position = position->get<double>();
        }
    } else {
        result.kind = DeviceMessage::Kind::Unknown;
    }
}

} // namespace

const char* serverSignalToString(ServerSignal signal) {
    switch (signal) {
        case ServerSignal::ResponseCreated: return "RESPONSE.CREATED";
        case ServerSignal::ResponseComplete: return "RESPONSE.COMPLETE";
        case ServerSignal::SessionCreated: return "SESSION.CREATED";
        case ServerSignal::SessionEnd: return "SESSION.END";
        case ServerSignal::ResponseError: return "RESPONSE.ERROR";
    }
    return "RESPONSE.ERROR";
}

json makeAuthMessage(const AuthPayload& payload) {
    json message = {
        {"type", "auth"},
        {"volume_control", payload.volume},
        {"is_ota", payload.isOta},
        {"is_reset", payload.isReset},
        {"pitch_factor", payload.pitchFactor},
        {"current_bhajan_status", payload.playbackStatus}
    };
    message["selected_bhajan_id"] = payload.selectedAssetId ? json(*payload.selectedAssetId) : json(nullptr);
    return message;
}

json makeServerMessage(ServerSignal signal, std::optional<int> volume) {
    json message = {{"type", "server"}, {"msg", serverSignalToString(signal)}};
    if (volume) {
        message["volume_control"] = *volume;
    }
    return message;
}

json makeErrorMessage(ErrorCode code, const std::string& text) {
    return {{"type", "error"}, {"code", errorCodeToString(code)}, {"message", text}};
}

json makePlaybackStatus(const std::string& status, const std::optional<std::string>& assetId) {
    json message = {{"type", "bhajan_status"}, {"status", status}};
    if (assetId) {
        message["bhajan_id"] = *assetId;
    }
    return message;
}

json makeDeviceCommand(const std::string& command,
                       const std::optional<std::string>& assetId,
                       const std::optional<std::string>& url) {
    json message = {{"type", "bhajan_command"}, {"command", command}, {"timestamp", isoTimestampNow()}};
    if (assetId) {
        message["bhajan_id"] = *assetId;
    }
    if (url) {
        message["url"] = *url;
    }
    return message;
}

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count() << 'Z';
    return ss.str();
}

DeviceMessage parseDeviceMessage(const std::string& text) {
    DeviceMessage result;

    json message = json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return result;
    }

    try {
        result.type = message.value("type", "");
    } catch (const json::exception&) {
        return result;
    }

    try {
        parseFields(message, result);
    } catch (const json::exception&) {
        result.kind = DeviceMessage::Kind::Invalid;
    }
    return result;
}

} // namespace vani::network::protocol

#include "session/user_directory.hpp"
#include "network/device_protocol.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

#include <cstddef>
#include <cstdio>
#include <fstream>

namespace vani::session {

using json = nlohmann::json;

namespace {

std::optional<std::string> optionalId(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
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

UserRecord toUserRecord(const json& entry) {
    UserRecord user;
    user.userId = entry.value("user_id", "");
    user.isPremium = entry.value("is_premium", false);
    user.cumulativeUsageSeconds = entry.value("session_time", uint64_t{0});
    user.providerTag = entry.value("provider", "");
    user.voice = entry.value("voice", "");
    user.pitchFactor = entry.value("pitch_factor", 1.0);
    user.systemPrompt = entry.value("system_prompt", "");
    user.firstMessage = entry.value("first_message", "");

    auto device = entry.find("device");
    if (device != entry.end() && device->is_object()) {
        DeviceRecord record;
        record.deviceId = device->value("device_id", "");
        record.volume = device->value("volume", 20);
        record.isOta = device->value("is_ota", false);
        record.isReset = device->value("is_reset", false);
        record.selectedAssetId = optionalId(*device, "selected_bhajan_id");
        record.playbackStatus = device->value("current_bhajan_status", "stopped");
        user.device = record;
    }
    return user;
}

} // namespace

JsonFileUserDirectory::JsonFileUserDirectory(std::string path, size_t conversationLimit)
    : path_(std::move(path)), conversationLimit_(conversationLimit) {}

void JsonFileUserDirectory::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "cannot open user directory " + path_);
    }

    json document = json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object() || !document.contains("users") ||
        !document["users"].is_array()) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "malformed user directory " + path_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    document_ = std::move(document);
    Logger::info("JsonFileUserDirectory: loaded {} users from {}", document_["users"].size(), path_);
}

json* JsonFileUserDirectory::findUser(const std::string& key, const std::string& value) {
    auto users = document_.find("users");
    if (users == document_.end() || !users->is_array()) {
        return nullptr;
    }
    for (auto& entry : *users) {
        auto field = entry.find(key);
        if (field != entry.end() && field->is_string() && field->get<std::string>() == value) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<UserRecord> JsonFileUserDirectory::resolveUser(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json* entry = findUser("token", token);
    if (!entry) {
        return std::nullopt;
    }
    try {
        return toUserRecord(*entry);
    } catch (const json::exception& e) {
        Logger::error("JsonFileUserDirectory: malformed user entry: {}", e.what());
        return std::nullopt;
    }
}

bool JsonFileUserDirectory::persistUsageSeconds(const std::string& userId, uint64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    json* entry = findUser("user_id", userId);
    if (!entry) {
        Logger::warning("JsonFileUserDirectory: usage for unknown user {}", userId);
        return false;
    }
    (*entry)["session_time"] = seconds;
    return save();
}

bool JsonFileUserDirectory::recordPlaybackStatus(const std::string& userId, const std::string& status,
                                                 const std::optional<std::string>& assetId) {
    std::lock_guard<std::mutex> lock(mutex_);
    json* entry = findUser("user_id", userId);
    if (!entry) {
        return false;
    }
    json& device = (*entry)["device"];
    if (!device.is_object()) {
        device = json::object();
    }
    device["current_bhajan_status"] = status;
    if (assetId) {
        device["selected_bhajan_id"] = *assetId;
    }
    return save();
}

bool JsonFileUserDirectory::recordConversation(const std::string& userId, const std::string& role,
                                               const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    json* entry = findUser("user_id", userId);
    if (!entry) {
        return false;
    }
    json& conversations = (*entry)["conversations"];
    if (!conversations.is_array()) {
        conversations = json::array();
    }
    conversations.push_back({{"role", role}, {"content", text}, {"created_at", network::protocol::isoTimestampNow()}});
    if (conversations.size() > conversationLimit_) {
        auto excess = static_cast<std::ptrdiff_t>(conversations.size() - conversationLimit_);
        conversations.erase(conversations.begin(), conversations.begin() + excess);
    }
    return save();
}

size_t JsonFileUserDirectory::userCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = document_.find("users");
    return users != document_.end() && users->is_array() ? users->size() : 0;
}

bool JsonFileUserDirectory::save() {
    const std::string tempPath = path_ + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("JsonFileUserDirectory: cannot write {}", tempPath);
            return false;
        }
        try {
            file << document_.dump(2);
        } catch (const json::exception& e) {
            Logger::error("JsonFileUserDirectory: cannot serialize directory: {}", e.what());
            return false;
        }
        if (!file.good()) {
            Logger::error("JsonFileUserDirectory: write to {} failed", tempPath);
            return false;
        }
    }
    if (std::rename(tempPath.c_str(), path_.c_str()) != 0) {
        Logger::error("JsonFileUserDirectory: cannot replace {}", path_);
        return false;
    }
    return true;
}

} // namespace vani::session

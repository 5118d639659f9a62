#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vani::session {

struct DeviceRecord {
    std::string deviceId;
    int volume = 20;
    bool isOta = false;
    bool isReset = false;
    std::optional<std::string> selectedAssetId;
    std::string playbackStatus = "stopped";
};

struct UserRecord {
    std::string userId;
    bool isPremium = false;
    uint64_t cumulativeUsageSeconds = 0;
    std::string providerTag;
    std::string voice;
    double pitchFactor = 1.0;
    std::string systemPrompt;
    std::string firstMessage;
    std::optional<DeviceRecord> device;
};

/**
 * @brief External user/device store consumed by the bridge
 */
class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    /// @return the user owning token, or nullopt when the token is unknown
    virtual std::optional<UserRecord> resolveUser(const std::string& token) = 0;

    virtual bool persistUsageSeconds(const std::string& userId, uint64_t seconds) = 0;

    virtual bool recordPlaybackStatus(const std::string& userId, const std::string& status,
                                      const std::optional<std::string>& assetId) = 0;

    /// role is "user" or "assistant"
    virtual bool recordConversation(const std::string& userId, const std::string& role,
                                    const std::string& text) = 0;
};

/**
 * @brief UserDirectory backed by a JSON document on disk
 *
 * Layout: {"users": [{"token", "user_id", "is_premium", "session_time",
 * "provider", "voice", "pitch_factor", "system_prompt", "first_message",
 * "device": {...}, "conversations": [...]}]}. Every mutation is written back
 * to the file. Each user keeps only the newest conversationLimit entries.
 */
class JsonFileUserDirectory : public UserDirectory {
public:
    static constexpr size_t DEFAULT_CONVERSATION_LIMIT = 50;

    explicit JsonFileUserDirectory(std::string path, size_t conversationLimit = DEFAULT_CONVERSATION_LIMIT);

    /// @throws BridgeError(InvalidConfiguration) when the file is missing or malformed
    void load();

    std::optional<UserRecord> resolveUser(const std::string& token) override;
    bool persistUsageSeconds(const std::string& userId, uint64_t seconds) override;
    bool recordPlaybackStatus(const std::string& userId, const std::string& status,
                              const std::optional<std::string>& assetId) override;
    bool recordConversation(const std::string& userId, const std::string& role,
                            const std::string& text) override;

    size_t userCount() const;

private:
    nlohmann::json* findUser(const std::string& key, const std::string& value);
    bool save();

    std::string path_;
    size_t conversationLimit_;
    mutable std::mutex mutex_;
    nlohmann::json document_;
};

} // namespace vani::session

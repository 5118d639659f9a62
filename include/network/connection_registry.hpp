#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "network/device_channel.hpp"

namespace vani::network {

/**
 * @brief Table of live device sockets keyed by device identifier
 *
 * A device may hold a primary (AI session) channel and a secondary command
 * channel at the same time; they are stored under distinct keys. Registering
 * an existing key replaces the previous socket. Safe for concurrent use from
 * any session or collaborator thread.
 */
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    static std::string primaryKey(const std::string& deviceId);
    static std::string commandKey(const std::string& deviceId);

    void registerChannel(const std::string& key, std::shared_ptr<DeviceChannel> channel);

    /// Remove key if present. No error when absent.
    void unregisterChannel(const std::string& key);

    /**
     * Remove key only while it still maps to expected, so a closing session
     * never evicts the socket that replaced it.
     * @return true if an entry was removed
     */
    bool unregisterChannel(const std::string& key, const DeviceChannel* expected);

    std::shared_ptr<DeviceChannel> lookup(const std::string& key) const;

    /// Serialize and write to the socket under key. Never throws.
    bool deliver(const std::string& key, const nlohmann::json& message) const;

    /**
     * Push a command to a device, preferring its command channel and falling
     * back to the primary channel.
     */
    bool sendCommandToDevice(const std::string& deviceId, const std::string& command,
                             const std::optional<std::string>& assetId = std::nullopt,
                             const std::optional<std::string>& url = std::nullopt) const;

    size_t size() const;
    std::vector<std::string> keys() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeviceChannel>> channels_;
};

} // namespace vani::network

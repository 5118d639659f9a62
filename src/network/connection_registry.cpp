#include "network/connection_registry.hpp"
#include "network/device_protocol.hpp"
#include "system/logger.hpp"

#include <mutex>

namespace vani::network {

std::string ConnectionRegistry::primaryKey(const std::string& deviceId) {
    return deviceId;
}

std::string ConnectionRegistry::commandKey(const std::string& deviceId) {
    return deviceId + "-bhajan";
}

void ConnectionRegistry::registerChannel(const std::string& key, std::shared_ptr<DeviceChannel> channel) {
    if (!channel) {
        Logger::warning("ConnectionRegistry: refusing to register null channel for {}", key);
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(key);
    if (it != channels_.end() && it->second != channel) {
        Logger::info("ConnectionRegistry: replacing channel for {}", key);
        it->second = std::move(channel);
        return;
    }
    channels_[key] = std::move(channel);
    Logger::debug("ConnectionRegistry: registered {} ({} live)", key, channels_.size());
}

void ConnectionRegistry::unregisterChannel(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (channels_.erase(key) > 0) {
        Logger::debug("ConnectionRegistry: unregistered {}", key);
    }
}

bool ConnectionRegistry::unregisterChannel(const std::string& key, const DeviceChannel* expected) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(key);
    if (it == channels_.end() || it->second.get() != expected) {
        return false;
    }
    channels_.erase(it);
    Logger::debug("ConnectionRegistry: unregistered {}", key);
    return true;
}

std::shared_ptr<DeviceChannel> ConnectionRegistry::lookup(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(key);
    return it == channels_.end() ? nullptr : it->second;
}

bool ConnectionRegistry::deliver(const std::string& key, const nlohmann::json& message) const {
    auto channel = lookup(key);
    if (!channel || !channel->isOpen()) {
        return false;
    }

    try {
        return channel->sendText(message.dump());
    } catch (const std::exception& e) {
        Logger::warning("ConnectionRegistry: delivery to {} failed: {}", key, e.what());
        return false;
    }
}

bool ConnectionRegistry::sendCommandToDevice(const std::string& deviceId, const std::string& command,
                                             const std::optional<std::string>& assetId,
                                             const std::optional<std::string>& url) const {
    nlohmann::json message = protocol::makeDeviceCommand(command, assetId, url);

    if (deliver(commandKey(deviceId), message)) {
        Logger::info("ConnectionRegistry: sent '{}' to command channel of {}", command, deviceId);
        return true;
    }
    if (deliver(primaryKey(deviceId), message)) {
        Logger::info("ConnectionRegistry: sent '{}' to primary channel of {}", command, deviceId);
        return true;
    }

    Logger::warning("ConnectionRegistry: device {} not connected on any channel", deviceId);
    return false;
}

size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return channels_.size();
}

std::vector<std::string> ConnectionRegistry::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(channels_.size());
    for (const auto& entry : channels_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace vani::network

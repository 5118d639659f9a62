#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "providers/provider_factory.hpp"
#include "session/bridge_session.hpp"

namespace vani::session {

/**
 * @brief Admits device connections and builds their sessions
 *
 * authenticate() runs before the WebSocket upgrade; a refusal there means no
 * session object is ever created. openSession() resolves the provider and
 * starts the bridge for an upgraded socket.
 */
class SessionOrchestrator {
public:
    struct AuthResult {
        bool accepted = false;
        int httpStatus = 401;
        std::string reason;
        std::optional<UserRecord> user;
    };

    SessionOrchestrator(std::shared_ptr<providers::ProviderFactory> providers,
                        SessionDependencies dependencies,
                        const SessionSettings& settings);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// @return the token of "Bearer <token>", nullopt if the header is not a bearer credential
    static std::optional<std::string> extractBearerToken(const std::string& authorizationHeader);

    /**
     * Validate the upgrade credentials. Missing or unknown token: 401.
     * User without a device record: 404.
     */
    AuthResult authenticate(const std::string& authorizationHeader) const;

    /**
     * Build and start the session for an upgraded socket.
     * An unknown provider tag is reported to the device and the socket closed;
     * nullptr is returned in that case.
     */
    std::shared_ptr<BridgeSession> openSession(const UserRecord& user,
                                               std::shared_ptr<network::DeviceChannel> channel);

    /// Close every session still alive (process shutdown).
    void closeAll(const std::string& reason);

    size_t activeSessions() const;

    network::ConnectionRegistry& registry() { return *deps_.registry; }
    const SessionSettings& settings() const { return settings_; }

private:
    void pruneLocked() const;

    std::shared_ptr<providers::ProviderFactory> providers_;
    SessionDependencies deps_;
    SessionSettings settings_;

    mutable std::mutex mutex_;
    mutable std::vector<std::weak_ptr<BridgeSession>> sessions_;
};

} // namespace vani::session

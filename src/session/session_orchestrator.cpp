#include "session/session_orchestrator.hpp"
#include "network/device_protocol.hpp"
#include "system/logger.hpp"

#include <algorithm>

namespace vani::session {

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<providers::ProviderFactory> providers,
                                         SessionDependencies dependencies,
                                         const SessionSettings& settings)
    : providers_(std::move(providers)), deps_(std::move(dependencies)), settings_(settings) {
    if (!providers_ || !deps_.registry || !deps_.directory || !deps_.assets || !deps_.encoderFactory) {
        throw BridgeError(ErrorCode::InvalidConfiguration, "SessionOrchestrator requires all collaborators");
    }
}

SessionOrchestrator::~SessionOrchestrator() {
    closeAll("server shutting down");
}

std::optional<std::string> SessionOrchestrator::extractBearerToken(const std::string& authorizationHeader) {
    static const std::string prefix = "Bearer ";
    if (authorizationHeader.size() <= prefix.size() ||
        authorizationHeader.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string token = authorizationHeader.substr(prefix.size());
    auto first = token.find_first_not_of(' ');
    auto last = token.find_last_not_of(' ');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    return token.substr(first, last - first + 1);
}

SessionOrchestrator::AuthResult SessionOrchestrator::authenticate(const std::string& authorizationHeader) const {
    AuthResult result;

    auto token = extractBearerToken(authorizationHeader);
    if (!token) {
        result.reason = "missing or invalid authorization header";
        Logger::warning("SessionOrchestrator: upgrade refused: {}", result.reason);
        return result;
    }

    auto user = deps_.directory->resolveUser(*token);
    if (!user) {
        result.reason = "invalid token";
        Logger::warning("SessionOrchestrator: upgrade refused: {}", result.reason);
        Logger::countFailure("auth");
        return result;
    }

    if (!user->device) {
        result.httpStatus = 404;
        result.reason = "no device registered for user";
        Logger::warning("SessionOrchestrator: upgrade refused for {}: {}", user->userId, result.reason);
        return result;
    }

    result.accepted = true;
    result.httpStatus = 101;
    result.user = std::move(user);
    return result;
}

std::shared_ptr<BridgeSession> SessionOrchestrator::openSession(const UserRecord& user,
                                                                std::shared_ptr<network::DeviceChannel> channel) {
    std::unique_ptr<providers::ProviderAdapter> adapter;
    providers::ConnectRequest request;
    try {
        adapter = providers_->create(user.providerTag);
        request.credentials = providers_->credentialsFor(user.providerTag, user.voice);
    } catch (const BridgeError& e) {
        Logger::error("SessionOrchestrator: refusing session for {}: {}", user.userId, e.what());
        channel->sendText(network::protocol::makeErrorMessage(e.code(), e.what()).dump());
        channel->close(network::close_code::POLICY_VIOLATION, e.what());
        return nullptr;
    }
    request.initialTurnText = user.firstMessage;
    request.systemContext = user.systemPrompt;

    auto session = std::make_shared<BridgeSession>(user, user.providerTag, std::move(adapter), std::move(request),
                                                    std::move(channel), deps_, settings_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruneLocked();
        sessions_.push_back(session);
    }
    session->start();
    return session;
}

void SessionOrchestrator::closeAll(const std::string& reason) {
    std::vector<std::shared_ptr<BridgeSession>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                live.push_back(std::move(session));
            }
        }
        sessions_.clear();
    }
    for (auto& session : live) {
        session->close(reason, network::close_code::GOING_AWAY);
    }
}

size_t SessionOrchestrator::activeSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneLocked();
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const auto& weak) {
        auto session = weak.lock();
        return session && session->state() != SessionState::Closed;
    }));
}

void SessionOrchestrator::pruneLocked() const {
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<BridgeSession>& weak) { return weak.expired(); }),
                    sessions_.end());
}

} // namespace vani::session

#include "network/device_server.hpp"
#include "network/device_protocol.hpp"
#include "system/logger.hpp"

#include <nlohmann/json.hpp>

namespace vani::network {

using json = nlohmann::json;
namespace http_status = websocketpp::http::status_code;

WebSocketDeviceChannel::WebSocketDeviceChannel(WebSocketServer& server, ConnectionHdl hdl, std::string description)
    : server_(server), hdl_(std::move(hdl)), description_(std::move(description)) {}

bool WebSocketDeviceChannel::sendText(const std::string& message) {
    if (!open_.load()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    server_.send(hdl_, message, websocketpp::frame::opcode::text, ec);
    if (ec) {
        Logger::warning("DeviceChannel[{}]: text send failed: {}", description_, ec.message());
        return false;
    }
    return true;
}

bool WebSocketDeviceChannel::sendBinary(const std::vector<uint8_t>& payload) {
    if (!open_.load()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    server_.send(hdl_, payload.data(), payload.size(), websocketpp::frame::opcode::binary, ec);
    if (ec) {
        Logger::warning("DeviceChannel[{}]: binary send failed: {}", description_, ec.message());
        return false;
    }
    return true;
}

void WebSocketDeviceChannel::close(uint16_t code, const std::string& reason) {
    if (!open_.exchange(false)) {
        return;
    }
    websocketpp::lib::error_code ec;
    server_.close(hdl_, code, reason, ec);
    if (ec) {
        Logger::debug("DeviceChannel[{}]: close failed: {}", description_, ec.message());
    }
}

DeviceServer::DeviceServer(std::shared_ptr<session::SessionOrchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

DeviceServer::~DeviceServer() {
    stop();
}

DeviceServer::RouteMatch DeviceServer::matchRoute(const std::string& resource) {
    RouteMatch match;
    std::string path = resource.substr(0, resource.find('?'));

    if (path == "/" || path.empty()) {
        match.route = Route::Primary;
        return match;
    }
    if (path == "/health") {
        match.route = Route::Health;
        return match;
    }

    static const std::string prefix = "/ws/device/";
    static const std::string suffix = "/bhajan";
    if (path.size() > prefix.size() + suffix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        std::string deviceId = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
        if (!deviceId.empty() && deviceId.find('/') == std::string::npos) {
            match.route = Route::Command;
            match.deviceId = deviceId;
        }
    }
    return match;
}

std::optional<int> DeviceServer::parseRssi(const std::string& header) {
    if (header.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(header, &consumed);
        if (consumed != header.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool DeviceServer::initialize(const Config& config) {
    if (initialized_.load()) {
        return true;
    }
    config_ = config;

    try {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.clear_error_channels(websocketpp::log::elevel::all);
        server_.set_error_channels(websocketpp::log::elevel::fatal);
        server_.init_asio();
        server_.set_reuse_addr(true);
        server_.set_max_message_size(config_.maxMessageSize);

        server_.set_validate_handler([this](ConnectionHdl hdl) { return handleValidate(hdl); });
        server_.set_http_handler([this](ConnectionHdl hdl) { handleHttp(hdl); });
        server_.set_open_handler([this](ConnectionHdl hdl) { handleOpen(hdl); });
        server_.set_message_handler([this](ConnectionHdl hdl, WebSocketServer::message_ptr msg) {
            handleMessage(hdl, msg);
        });
        server_.set_close_handler([this](ConnectionHdl hdl) { handleClose(hdl); });
        server_.set_fail_handler([this](ConnectionHdl hdl) { handleClose(hdl); });
    } catch (const std::exception& e) {
        Logger::error("DeviceServer: initialization failed: {}", e.what());
        return false;
    }

    initialized_.store(true);
    return true;
}

bool DeviceServer::start() {
    if (!initialized_.load() || running_.load()) {
        return false;
    }

    websocketpp::lib::error_code ec;
    server_.listen(config_.bindAddress, std::to_string(config_.port), ec);
    if (ec) {
        Logger::error("DeviceServer: cannot listen on {}:{}: {}", config_.bindAddress, config_.port, ec.message());
        return false;
    }
    server_.start_accept(ec);
    if (ec) {
        Logger::error("DeviceServer: cannot accept connections: {}", ec.message());
        return false;
    }

    running_.store(true);
    uint32_t threads = config_.ioThreads > 0 ? config_.ioThreads : 1;
    for (uint32_t i = 0; i < threads; ++i) {
        ioThreads_.emplace_back([this]() {
            try {
                server_.run();
            } catch (const std::exception& e) {
                Logger::critical("DeviceServer: I/O thread terminated: {}", e.what());
            }
        });
    }

    Logger::info("DeviceServer: listening on {}:{} with {} I/O threads", config_.bindAddress, config_.port, threads);
    return true;
}

void DeviceServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    Logger::info("DeviceServer: stopping");

    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);

    orchestrator_->closeAll("server shutting down");

    std::vector<std::shared_ptr<WebSocketDeviceChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& entry : connections_) {
            if (entry.second.channel) {
                channels.push_back(entry.second.channel);
            }
        }
    }
    for (auto& channel : channels) {
        channel->close(close_code::GOING_AWAY, "server shutting down");
    }

    server_.stop();
    for (auto& thread : ioThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    ioThreads_.clear();

    std::lock_guard<std::mutex> lock(connectionsMutex_);
    connections_.clear();
}

size_t DeviceServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return connections_.size();
}

bool DeviceServer::handleValidate(ConnectionHdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    RouteMatch match = matchRoute(con->get_resource());

    if (match.route != Route::Primary && match.route != Route::Command) {
        con->set_status(http_status::not_found);
        return false;
    }

    auto auth = orchestrator_->authenticate(con->get_request_header("Authorization"));
    if (!auth.accepted) {
        con->set_status(auth.httpStatus == 404 ? http_status::not_found : http_status::unauthorized);
        con->set_body(json{{"error", auth.reason}}.dump());
        return false;
    }

    const auto& user = *auth.user;
    if (match.route == Route::Command && user.device->deviceId != match.deviceId) {
        Logger::warning("DeviceServer: user {} tried to open command channel of {}", user.userId, match.deviceId);
        con->set_status(http_status::not_found);
        return false;
    }
    if (match.route == Route::Primary) {
        match.deviceId = user.device->deviceId;
    }

    if (auto rssi = parseRssi(con->get_request_header("X-Wifi-Rssi"))) {
        Logger::info("DeviceServer: device {} connecting, Wi-Fi RSSI {} dBm", match.deviceId, *rssi);
    }

    Connection connection;
    connection.route = match;
    connection.user = user;

    std::lock_guard<std::mutex> lock(connectionsMutex_);
    connections_[hdl] = std::move(connection);
    return true;
}

void DeviceServer::handleHttp(ConnectionHdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    RouteMatch match = matchRoute(con->get_resource());

    if (match.route == Route::Health && con->get_request().get_method() == "GET") {
        json body = {
            {"status", "ok"},
            {"timestamp", protocol::isoTimestampNow()},
            {"sessions", orchestrator_->activeSessions()}
        };
        con->set_status(http_status::ok);
        con->append_header("Content-Type", "application/json");
        con->set_body(body.dump());
        return;
    }

    con->set_status(http_status::not_found);
    con->set_body(json{{"error", "not found"}}.dump());
}

void DeviceServer::handleOpen(ConnectionHdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);

    Connection connection;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(hdl);
        if (it == connections_.end()) {
            Logger::error("DeviceServer: open without a validated upgrade");
            return;
        }
        it->second.channel = std::make_shared<WebSocketDeviceChannel>(
            server_, hdl, it->second.route.deviceId + "@" + con->get_remote_endpoint());
        connection = it->second;
    }

    if (connection.route.route == Route::Command) {
        orchestrator_->registry().registerChannel(ConnectionRegistry::commandKey(connection.route.deviceId),
                                                  connection.channel);
        Logger::info("DeviceServer: command channel open for {}", connection.route.deviceId);
        return;
    }

    auto session = orchestrator_->openSession(connection.user, connection.channel);

    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(hdl);
    if (it != connections_.end()) {
        it->second.session = std::move(session);
    } else if (session) {
        // closed while the session was starting
        session->close("device disconnected");
    }
}

void DeviceServer::handleMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg) {
    std::shared_ptr<session::BridgeSession> session;
    RouteMatch route;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(hdl);
        if (it == connections_.end()) {
            return;
        }
        session = it->second.session;
        route = it->second.route;
    }

    if (route.route == Route::Command) {
        Logger::info("DeviceServer: command channel {} says {}", route.deviceId, msg->get_payload());
        return;
    }
    if (!session) {
        return;
    }

    const std::string& payload = msg->get_payload();
    if (msg->get_opcode() == websocketpp::frame::opcode::binary) {
        session->onDeviceBinary(std::vector<uint8_t>(payload.begin(), payload.end()));
    } else {
        session->onDeviceText(payload);
    }
}

std::optional<DeviceServer::Connection> DeviceServer::takeConnection(ConnectionHdl hdl) {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    Connection connection = std::move(it->second);
    connections_.erase(it);
    return connection;
}

void DeviceServer::handleClose(ConnectionHdl hdl) {
    auto connection = takeConnection(hdl);
    if (!connection) {
        return;
    }

    if (connection->channel) {
        connection->channel->markClosed();
    }

    if (connection->route.route == Route::Command) {
        orchestrator_->registry().unregisterChannel(ConnectionRegistry::commandKey(connection->route.deviceId),
                                                    connection->channel.get());
        Logger::info("DeviceServer: command channel closed for {}", connection->route.deviceId);
        return;
    }

    if (connection->session) {
        connection->session->close("device disconnected");
    }
    Logger::info("DeviceServer: device {} disconnected", connection->route.deviceId);
}

} // namespace vani::network

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "network/device_channel.hpp"
#include "session/session_orchestrator.hpp"

namespace vani::network {

using WebSocketServer = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;

/**
 * @brief DeviceChannel over a websocketpp server connection
 */
class WebSocketDeviceChannel : public DeviceChannel {
public:
    WebSocketDeviceChannel(WebSocketServer& server, ConnectionHdl hdl, std::string description);

    bool sendText(const std::string& message) override;
    bool sendBinary(const std::vector<uint8_t>& payload) override;
    bool isOpen() const override { return open_.load(); }
    void close(uint16_t code, const std::string& reason) override;
    std::string describe() const override { return description_; }

    /// The socket closed underneath us; later sends fail fast.
    void markClosed() { open_.store(false); }

private:
    WebSocketServer& server_;
    ConnectionHdl hdl_;
    std::string description_;
    std::atomic<bool> open_{true};
};

/**
 * @brief Device-facing WebSocket endpoint
 *
 * Routes:
 *   /                           primary AI session
 *   /ws/device/<id>/bhajan      secondary command channel
 *   GET /health                 plain HTTP liveness probe
 *
 * Credentials are checked in the validate handler, so refused devices get an
 * HTTP status instead of an upgrade.
 */
class DeviceServer {
public:
    struct Config {
        std::string bindAddress = "0.0.0.0";
        uint16_t port = 8000;
        uint32_t ioThreads = 1;
        size_t maxMessageSize = 1024 * 1024;
    };

    enum class Route {
        Primary,
        Command,
        Health,
        NotFound
    };

    struct RouteMatch {
        Route route = Route::NotFound;
        std::string deviceId;
    };

    explicit DeviceServer(std::shared_ptr<session::SessionOrchestrator> orchestrator);
    ~DeviceServer();

    DeviceServer(const DeviceServer&) = delete;
    DeviceServer& operator=(const DeviceServer&) = delete;

    bool initialize(const Config& config);
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    size_t connectionCount() const;

    static RouteMatch matchRoute(const std::string& resource);
    static std::optional<int> parseRssi(const std::string& header);

private:
    struct Connection {
        RouteMatch route;
        session::UserRecord user;
        std::shared_ptr<WebSocketDeviceChannel> channel;
        std::shared_ptr<session::BridgeSession> session;
    };

    bool handleValidate(ConnectionHdl hdl);
    void handleHttp(ConnectionHdl hdl);
    void handleOpen(ConnectionHdl hdl);
    void handleMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg);
    void handleClose(ConnectionHdl hdl);

    std::optional<Connection> takeConnection(ConnectionHdl hdl);

    std::shared_ptr<session::SessionOrchestrator> orchestrator_;
    Config config_;
    WebSocketServer server_;
    std::vector<std::thread> ioThreads_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};

    mutable std::mutex connectionsMutex_;
    std::map<ConnectionHdl, Connection, std::owner_less<ConnectionHdl>> connections_;
};

} // namespace vani::network

#pragma once

#include <memory>
#include <string>

#include "network/upstream_transport.hpp"

namespace vani::network {

/**
 * @brief websocketpp client transport with its own I/O thread
 *
 * wss:// URLs use the TLS client config (system CA bundle, peer verification);
 * ws:// URLs use the plain asio client.
 */
class WebSocketUpstream : public UpstreamTransport {
public:
    struct Config {
        uint32_t openHandshakeTimeoutMs = 10000;
        uint32_t closeHandshakeTimeoutMs = 2000;
        bool verifyPeer = true;
    };

    WebSocketUpstream();
    explicit WebSocketUpstream(const Config& config);
    ~WebSocketUpstream() override;

    WebSocketUpstream(const WebSocketUpstream&) = delete;
    WebSocketUpstream& operator=(const WebSocketUpstream&) = delete;

    void open(const std::string& url, const Headers& headers, Handlers handlers) override;
    bool sendText(const std::string& message) override;
    void close() override;

    class Impl;

private:
    Config config_;
    std::shared_ptr<Impl> impl_;
};

UpstreamTransportFactory makeWebSocketUpstreamFactory(const WebSocketUpstream::Config& config = {});

} // namespace vani::network

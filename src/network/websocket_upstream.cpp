#include "network/websocket_upstream.hpp"
#include "system/logger.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <type_traits>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

namespace vani::network {

class WebSocketUpstream::Impl {
public:
    virtual ~Impl() = default;
    virtual void open(const std::string& url, const Headers& headers, Handlers handlers) = 0;
    virtual bool send(const std::string& message) = 0;
    virtual void shutdown() = 0;
};

namespace {

using TlsConfig = websocketpp::config::asio_tls_client;
using PlainConfig = websocketpp::config::asio_client;
using SslContext = websocketpp::lib::asio::ssl::context;

template<typename ClientConfig>
class ClientImpl : public WebSocketUpstream::Impl,
                   public std::enable_shared_from_this<ClientImpl<ClientConfig>> {
public:
    using Client = websocketpp::client<ClientConfig>;

    explicit ClientImpl(const WebSocketUpstream::Config& config) : config_(config) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        client_.start_perpetual();

        if constexpr (std::is_same_v<ClientConfig, TlsConfig>) {
            bool verifyPeer = config_.verifyPeer;
            client_.set_tls_init_handler([verifyPeer](websocketpp::connection_hdl) {
                auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
                context->set_default_verify_paths();
                context->set_verify_mode(verifyPeer ? websocketpp::lib::asio::ssl::verify_peer
                                                    : websocketpp::lib::asio::ssl::verify_none);
                return context;
            });
        }
    }

    ~ClientImpl() override {
        if (ioThread_.joinable()) {
            if (ioThread_.get_id() == std::this_thread::get_id()) {
                ioThread_.detach();
            } else {
                ioThread_.join();
            }
        }
    }

    void open(const std::string& url, const Headers& headers, Handlers handlers) override {
        {
            std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
            handlers_ = std::move(handlers);
        }

        websocketpp::lib::error_code ec;
        auto connection = client_.get_connection(url, ec);
        if (ec) {
            notifyFail("invalid upstream URL: " + ec.message());
            return;
        }

        for (const auto& header : headers) {
            connection->append_header(header.first, header.second);
        }
        connection->set_open_handshake_timeout(config_.openHandshakeTimeoutMs);
        connection->set_close_handshake_timeout(config_.closeHandshakeTimeoutMs);

        std::weak_ptr<ClientImpl> weak = this->shared_from_this();
        connection->set_open_handler([weak](websocketpp::connection_hdl) {
            if (auto self = weak.lock()) {
                self->dispatch([](Handlers& h) { if (h.onOpen) h.onOpen(); });
            }
        });
        connection->set_message_handler([weak](websocketpp::connection_hdl, typename Client::message_ptr msg) {
            if (auto self = weak.lock()) {
                const std::string& payload = msg->get_payload();
                self->dispatch([&payload](Handlers& h) { if (h.onText) h.onText(payload); });
            }
        });
        connection->set_fail_handler([weak](websocketpp::connection_hdl hdl) {
            if (auto self = weak.lock()) {
                std::string reason = "connection failed";
                websocketpp::lib::error_code lookupEc;
                auto con = self->client_.get_con_from_hdl(hdl, lookupEc);
                if (!lookupEc && con) {
                    reason = con->get_ec().message() + " (HTTP " +
                             std::to_string(static_cast<int>(con->get_response_code())) + ")";
                }
                self->notifyFail(reason);
            }
        });
        connection->set_close_handler([weak](websocketpp::connection_hdl hdl) {
            if (auto self = weak.lock()) {
                uint16_t code = 0;
                std::string reason;
                websocketpp::lib::error_code lookupEc;
                auto con = self->client_.get_con_from_hdl(hdl, lookupEc);
                if (!lookupEc && con) {
                    code = con->get_remote_close_code();
                    reason = con->get_remote_close_reason();
                }
                self->dispatch([code, &reason](Handlers& h) { if (h.onClose) h.onClose(code, reason); });
            }
        });

        hdl_ = connection->get_handle();
        client_.connect(connection);

        auto self = this->shared_from_this();
        ioThread_ = std::thread([self]() {
            try {
                self->client_.run();
            } catch (const std::exception& e) {
                Logger::error("WebSocketUpstream: I/O loop terminated: {}", e.what());
            }
        });
    }

    bool send(const std::string& message) override {
        if (closed_.load()) {
            return false;
        }
        websocketpp::lib::error_code ec;
        client_.send(hdl_, message, websocketpp::frame::opcode::text, ec);
        if (ec) {
            Logger::warning("WebSocketUpstream: send failed: {}", ec.message());
            return false;
        }
        return true;
    }

    void shutdown() override {
        if (closed_.exchange(true)) {
            return;
        }

        {
            std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
            handlers_ = Handlers{};
        }

        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, "session closed", ec);
        client_.stop_perpetual();

        if (ioThread_.joinable() && ioThread_.get_id() != std::this_thread::get_id()) {
            ioThread_.join();
        }
    }

private:
    template<typename Fn>
    void dispatch(Fn&& fn) {
        std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
        if (closed_.load()) {
            return;
        }
        // A handler may call shutdown(), which resets handlers_
        Handlers handlers = handlers_;
        try {
            fn(handlers);
        } catch (const std::exception& e) {
            Logger::error("WebSocketUpstream: handler threw: {}", e.what());
        }
    }

    void notifyFail(const std::string& reason) {
        dispatch([&reason](Handlers& h) { if (h.onFail) h.onFail(reason); });
    }

    WebSocketUpstream::Config config_;
    Client client_;
    websocketpp::connection_hdl hdl_;
    std::thread ioThread_;
    std::recursive_mutex callbackMutex_;
    Handlers handlers_;
    std::atomic<bool> closed_{false};
};

bool isSecureUrl(const std::string& url) {
    return url.rfind("wss://", 0) == 0;
}

} // namespace

WebSocketUpstream::WebSocketUpstream() : WebSocketUpstream(Config{}) {}

WebSocketUpstream::WebSocketUpstream(const Config& config) : config_(config) {}

WebSocketUpstream::~WebSocketUpstream() {
    close();
}

void WebSocketUpstream::open(const std::string& url, const Headers& headers, Handlers handlers) {
    if (impl_) {
        Logger::warning("WebSocketUpstream: open called twice, ignoring");
        return;
    }

    auto onFail = handlers.onFail;
    try {
        if (isSecureUrl(url)) {
            impl_ = std::make_shared<ClientImpl<TlsConfig>>(config_);
        } else {
            impl_ = std::make_shared<ClientImpl<PlainConfig>>(config_);
        }
        impl_->open(url, headers, std::move(handlers));
    } catch (const std::exception& e) {
        Logger::error("WebSocketUpstream: cannot start client: {}", e.what());
        impl_.reset();
        if (onFail) {
            onFail(e.what());
        }
    }
}

bool WebSocketUpstream::sendText(const std::string& message) {
    return impl_ ? impl_->send(message) : false;
}

void WebSocketUpstream::close() {
    if (impl_) {
        impl_->shutdown();
    }
}

UpstreamTransportFactory makeWebSocketUpstreamFactory(const WebSocketUpstream::Config& config) {
    return [config]() -> std::unique_ptr<UpstreamTransport> {
        return std::make_unique<WebSocketUpstream>(config);
    };
}

} // namespace vani::network

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace vani::network {

/**
 * @brief Client socket to an upstream realtime voice service
 *
 * open() returns immediately; progress is reported through the handlers,
 * which run on the transport's own I/O thread.
 */
class UpstreamTransport {
public:
    struct Handlers {
        std::function<void()> onOpen;
        std::function<void(const std::string&)> onText;
        std::function<void(const std::string& reason)> onFail;
        std::function<void(uint16_t code, const std::string& reason)> onClose;
    };

    using Headers = std::map<std::string, std::string>;

    virtual ~UpstreamTransport() = default;

    virtual void open(const std::string& url, const Headers& headers, Handlers handlers) = 0;
    virtual bool sendText(const std::string& message) = 0;

    /// Idempotent. Handlers are not invoked after close() returns.
    virtual void close() = 0;
};

using UpstreamTransportFactory = std::function<std::unique_ptr<UpstreamTransport>()>;

} // namespace vani::network

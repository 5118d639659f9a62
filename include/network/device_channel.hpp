#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vani::network {

/**
 * @brief Outbound half of a device socket
 *
 * Sends never throw; a closed or failed socket reports false.
 */
class DeviceChannel {
public:
    virtual ~DeviceChannel() = default;

    virtual bool sendText(const std::string& message) = 0;
    virtual bool sendBinary(const std::vector<uint8_t>& payload) = 0;
    virtual bool isOpen() const = 0;
    virtual void close(uint16_t code, const std::string& reason) = 0;

    /// Identifier for logging (remote endpoint or a test name)
    virtual std::string describe() const = 0;
};

namespace close_code {
constexpr uint16_t NORMAL = 1000;
constexpr uint16_t GOING_AWAY = 1001;
constexpr uint16_t POLICY_VIOLATION = 1008;
constexpr uint16_t INTERNAL_ERROR = 1011;
} // namespace close_code

} // namespace vani::network

#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <chrono>
#include <memory>

class QTcpSocket;

namespace lumen::network {

inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{2000};

/**
 * DeviceConnection - Control stream to one discovered light.
 *
 * Opened on demand from a Device's location, never during discovery. A
 * failed open is a Connection error and leaves the Device untouched.
 */
class DeviceConnection {
public:
    [[nodiscard]] static Result<std::unique_ptr<DeviceConnection>, Error>
    open(const Endpoint& location, std::chrono::milliseconds timeout = kDefaultConnectTimeout);

    [[nodiscard]] static Result<std::unique_ptr<DeviceConnection>, Error>
    open(const Device& device, std::chrono::milliseconds timeout = kDefaultConnectTimeout);

    ~DeviceConnection();

    DeviceConnection(const DeviceConnection&) = delete;
    DeviceConnection& operator=(const DeviceConnection&) = delete;

    [[nodiscard]] const Endpoint& endpoint() const { return endpoint_; }
    [[nodiscard]] bool is_open() const;

    void close();

private:
    DeviceConnection(Endpoint endpoint, std::unique_ptr<QTcpSocket> socket);

    Endpoint endpoint_;
    std::unique_ptr<QTcpSocket> socket_;
};

} // namespace lumen::network

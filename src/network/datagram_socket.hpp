#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

class QUdpSocket;

namespace lumen::network {

// Upper bound for one advertisement; longer datagrams are truncated.
inline constexpr qint64 kReceiveBufferSize = 1024;

struct Datagram {
    QByteArray payload;
    Endpoint sender;
};

/**
 * DatagramSocket - Datagram channel used by DiscoveryTransport.
 *
 * The UDP implementation owns a real socket; tests substitute a scripted one.
 */
class DatagramSocket {
public:
    virtual ~DatagramSocket() = default;

    virtual Result<void, Error> send_to(const QByteArray& payload, const Endpoint& target) = 0;

    /**
     * Next pending datagram, waiting at most `wait` for one to arrive.
     * Returns nothing when none is available; this is not an error.
     */
    virtual std::optional<Datagram> receive(std::chrono::milliseconds wait) = 0;

    [[nodiscard]] virtual uint16_t local_port() const = 0;
};

// Configuration error unless `group` is an IPv4 multicast address (224.0.0.0/4).
[[nodiscard]] Result<void, Error> validate_multicast_group(const Endpoint& group);

/**
 * UdpDatagramSocket - QUdpSocket bound to 0.0.0.0:<local_port> and joined to
 * a multicast group. Leaves the group and closes on destruction.
 */
class UdpDatagramSocket final : public DatagramSocket {
public:
    [[nodiscard]] static Result<std::unique_ptr<UdpDatagramSocket>, Error>
    bind_multicast(const Endpoint& group, uint16_t local_port);

    ~UdpDatagramSocket() override;

    UdpDatagramSocket(const UdpDatagramSocket&) = delete;
    UdpDatagramSocket& operator=(const UdpDatagramSocket&) = delete;

    Result<void, Error> send_to(const QByteArray& payload, const Endpoint& target) override;
    std::optional<Datagram> receive(std::chrono::milliseconds wait) override;
    [[nodiscard]] uint16_t local_port() const override;

    [[nodiscard]] QHostAddress local_address() const;

private:
    UdpDatagramSocket(std::unique_ptr<QUdpSocket> socket, QHostAddress group);

    std::unique_ptr<QUdpSocket> socket_;
    QHostAddress group_;
};

} // namespace lumen::network

#include "network/datagram_socket.hpp"

#include "core/logging.hpp"

#include <QUdpSocket>

namespace lumen::network {

Result<void, Error> validate_multicast_group(const Endpoint& group) {
    if (group.address.protocol() != QAbstractSocket::IPv4Protocol || !group.address.isMulticast()) {
        return Result<void, Error>::err(Error::configuration(
            "not an IPv4 multicast group: " + group.to_string().toStdString()));
    }
    return Result<void, Error>::ok();
}

Result<std::unique_ptr<UdpDatagramSocket>, Error>
UdpDatagramSocket::bind_multicast(const Endpoint& group, uint16_t local_port) {
    using SocketResult = Result<std::unique_ptr<UdpDatagramSocket>, Error>;

    auto valid = validate_multicast_group(group);
    if (valid.is_err()) {
        return SocketResult::err(valid.unwrap_err());
    }

    auto socket = std::make_unique<QUdpSocket>();

    // Devices answer from their own addresses, so listen on every interface.
    if (!socket->bind(QHostAddress::AnyIPv4,
                      local_port,
                      QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        return SocketResult::err(Error::configuration(
            "bind to port " + std::to_string(local_port) + " failed: " +
            socket->errorString().toStdString()));
    }

    socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    if (!socket->joinMulticastGroup(group.address)) {
        return SocketResult::err(Error::configuration(
            "joining " + group.address.toString().toStdString() + " failed: " +
            socket->errorString().toStdString()));
    }

    qCDebug(lumenDiscoveryLog) << "bound" << socket->localAddress().toString()
                               << "port" << socket->localPort()
                               << "group" << group.address.toString();

    return SocketResult::ok(std::unique_ptr<UdpDatagramSocket>(
        new UdpDatagramSocket(std::move(socket), group.address)));
}

UdpDatagramSocket::UdpDatagramSocket(std::unique_ptr<QUdpSocket> socket, QHostAddress group)
    : socket_(std::move(socket))
    , group_(std::move(group))
{
}

UdpDatagramSocket::~UdpDatagramSocket() {
    if (!socket_) return;
    socket_->leaveMulticastGroup(group_);
    socket_->close();
}

Result<void, Error> UdpDatagramSocket::send_to(const QByteArray& payload, const Endpoint& target) {
    const auto written = socket_->writeDatagram(payload, target.address, target.port);
    if (written != payload.size()) {
        return Result<void, Error>::err(Error::transport_send(
            "send to " + target.to_string().toStdString() + " failed: " +
            socket_->errorString().toStdString()));
    }
    return Result<void, Error>::ok();
}

std::optional<Datagram> UdpDatagramSocket::receive(std::chrono::milliseconds wait) {
    if (!socket_->hasPendingDatagrams()) {
        if (wait.count() <= 0 || !socket_->waitForReadyRead(static_cast<int>(wait.count()))) {
            return std::nullopt;
        }
        if (!socket_->hasPendingDatagrams()) {
            return std::nullopt;
        }
    }

    QByteArray buffer(static_cast<qsizetype>(kReceiveBufferSize), '\0');
    QHostAddress sender;
    quint16 sender_port = 0;
    const auto size = socket_->readDatagram(buffer.data(), kReceiveBufferSize, &sender, &sender_port);
    if (size < 0) {
        qCDebug(lumenDiscoveryLog) << "receive failed:" << socket_->errorString();
        return std::nullopt;
    }

    buffer.truncate(static_cast<qsizetype>(size));
    return Datagram{std::move(buffer), Endpoint{sender, sender_port}};
}

uint16_t UdpDatagramSocket::local_port() const {
    return socket_->localPort();
}

QHostAddress UdpDatagramSocket::local_address() const {
    return socket_->localAddress();
}

} // namespace lumen::network

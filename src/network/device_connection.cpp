#include "network/device_connection.hpp"

#include "core/logging.hpp"

#include <QTcpSocket>

namespace lumen::network {

Result<std::unique_ptr<DeviceConnection>, Error>
DeviceConnection::open(const Endpoint& location, std::chrono::milliseconds timeout) {
    using ConnectionResult = Result<std::unique_ptr<DeviceConnection>, Error>;

    if (location.address.protocol() != QAbstractSocket::IPv4Protocol || location.port == 0) {
        return ConnectionResult::err(
            Error::connection("invalid device location " + location.to_string().toStdString()));
    }

    auto socket = std::make_unique<QTcpSocket>();
    socket->connectToHost(location.address, location.port);
    if (!socket->waitForConnected(static_cast<int>(timeout.count()))) {
        const auto reason = socket->errorString();
        qCWarning(lumenConnectionLog) << "connect to" << location.to_string() << "failed:" << reason;
        socket->abort();
        return ConnectionResult::err(Error::connection(
            "connect to " + location.to_string().toStdString() + " failed: " + reason.toStdString()));
    }

    qCDebug(lumenConnectionLog) << "connected to" << location.to_string();
    return ConnectionResult::ok(std::unique_ptr<DeviceConnection>(
        new DeviceConnection(location, std::move(socket))));
}

Result<std::unique_ptr<DeviceConnection>, Error>
DeviceConnection::open(const Device& device, std::chrono::milliseconds timeout) {
    return open(device.location(), timeout);
}

DeviceConnection::DeviceConnection(Endpoint endpoint, std::unique_ptr<QTcpSocket> socket)
    : endpoint_(std::move(endpoint))
    , socket_(std::move(socket))
{
}

DeviceConnection::~DeviceConnection() {
    close();
}

bool DeviceConnection::is_open() const {
    return socket_ && socket_->state() == QAbstractSocket::ConnectedState;
}

void DeviceConnection::close() {
    if (!socket_ || socket_->state() == QAbstractSocket::UnconnectedState) {
        return;
    }
    socket_->disconnectFromHost();
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->abort();
    }
    qCDebug(lumenConnectionLog) << "closed" << endpoint_.to_string();
}

} // namespace lumen::network

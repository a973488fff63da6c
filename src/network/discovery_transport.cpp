#include "network/discovery_transport.hpp"

#include "core/logging.hpp"
#include "network/dedupe_collector.hpp"
#include "network/device_decoder.hpp"
#include "network/response_parser.hpp"

#include <QElapsedTimer>
#include <algorithm>

namespace lumen::network {
namespace {

// Longest single wait for readiness; keeps each poll short and the deadline tight.
constexpr std::chrono::milliseconds kPollInterval{10};

using TransportResult = Result<std::unique_ptr<DiscoveryTransport>, Error>;

} // namespace

QByteArray search_message() {
    return QByteArray(kSearchMessage, static_cast<qsizetype>(sizeof(kSearchMessage) - 1));
}

TransportResult DiscoveryTransport::create(const Endpoint& group, uint16_t local_port) {
    auto socket = UdpDatagramSocket::bind_multicast(group, local_port);
    if (socket.is_err()) {
        qCWarning(lumenDiscoveryLog) << "transport setup failed:"
                                     << QString::fromStdString(socket.unwrap_err().message);
        return TransportResult::err(socket.unwrap_err());
    }
    return with_socket(group, std::move(socket).unwrap());
}

TransportResult DiscoveryTransport::create(const DiscoveryConfig& config) {
    return create(config.group, config.local_port);
}

TransportResult DiscoveryTransport::with_socket(const Endpoint& group, Socket socket) {
    auto valid = validate_multicast_group(group);
    if (valid.is_err()) {
        return TransportResult::err(valid.unwrap_err());
    }
    if (!socket) {
        return TransportResult::err(Error::configuration("no socket"));
    }
    return TransportResult::ok(std::unique_ptr<DiscoveryTransport>(
        new DiscoveryTransport(group, std::move(socket))));
}

DiscoveryTransport::DiscoveryTransport(Endpoint group, Socket socket)
    : group_(std::move(group))
    , socket_(std::move(socket))
{
}

Result<std::vector<Device>, Error> DiscoveryTransport::discover(std::chrono::milliseconds timeout) {
    QElapsedTimer clock;
    clock.start();

    auto sent = socket_->send_to(search_message(), group_);
    if (sent.is_err()) {
        qCWarning(lumenDiscoveryLog) << "search not sent:"
                                     << QString::fromStdString(sent.unwrap_err().message);
        return Result<std::vector<Device>, Error>::err(sent.unwrap_err());
    }
    qCDebug(lumenDiscoveryLog) << "search sent to" << group_.to_string()
                               << "timeout ms" << timeout.count();

    DedupeCollector collector;
    std::size_t received = 0;

    while (clock.elapsed() < timeout.count()) {
        const auto remaining = timeout - std::chrono::milliseconds(clock.elapsed());
        auto datagram = socket_->receive(std::min(remaining, kPollInterval));
        if (!datagram) {
            continue;
        }
        ++received;
        handle_datagram(*datagram, collector);
    }

    qCInfo(lumenDiscoveryLog) << "discovery finished:" << collector.size() << "devices from"
                              << received << "responses";
    return Result<std::vector<Device>, Error>::ok(collector.finish());
}

void DiscoveryTransport::handle_datagram(const Datagram& datagram, DedupeCollector& collector) {
    if (datagram.sender.address.protocol() != QAbstractSocket::IPv4Protocol) {
        qCDebug(lumenDiscoveryLog) << "ignoring non-IPv4 sender" << datagram.sender.address.toString();
        return;
    }

    auto parsed = parse_response(datagram.payload);
    if (parsed.is_err()) {
        qCDebug(lumenDiscoveryLog) << "dropping datagram from" << datagram.sender.to_string() << ":"
                                   << QString::fromStdString(parsed.unwrap_err().message);
        return;
    }

    const auto& headers = parsed.unwrap().headers;
    auto device = decode_device(headers, resolve_location(headers, datagram.sender));
    if (device.is_err()) {
        qCDebug(lumenDiscoveryLog) << "dropping advertisement from" << datagram.sender.to_string() << ":"
                                   << QString::fromStdString(device.unwrap_err().message);
        return;
    }

    const auto& found = device.unwrap();
    if (!collector.offer(found)) {
        qCDebug(lumenDiscoveryLog) << "duplicate advertisement for" << found.id();
        return;
    }

    qCInfo(lumenDiscoveryLog) << "found" << found.id() << found.model() << "at" << found.location().to_string();
    if (on_device_discovered) {
        on_device_discovered(found);
    }
}

} // namespace lumen::network

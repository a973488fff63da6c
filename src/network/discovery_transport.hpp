#pragma once

#include "core/config.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "network/datagram_socket.hpp"

#include <QByteArray>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace lumen::network {

class DedupeCollector;

/**
 * The one query sent per session, byte for byte.
 */
inline constexpr char kSearchMessage[] =
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1982\r\n"
    "MAN: \"ssdp:discover\"\r\n"
    "ST: wifi_bulb";

[[nodiscard]] QByteArray search_message();

/**
 * DiscoveryTransport - Finds lights with a single multicast search.
 *
 * Owns its socket for its whole lifetime. `discover()` runs on the caller's
 * thread: one query out, then every datagram that arrives before the timeout
 * is parsed, decoded and deduplicated. Bad datagrams are dropped one by one;
 * only a failed send ends the session with an error.
 */
class DiscoveryTransport {
public:
    using Socket = std::unique_ptr<DatagramSocket>;

    /**
     * Bind 0.0.0.0:<local_port> and join `group`.
     * Fails with a Configuration error for a non-multicast group or when the
     * bind or group join fails.
     */
    [[nodiscard]] static Result<std::unique_ptr<DiscoveryTransport>, Error>
    create(const Endpoint& group, uint16_t local_port = kDefaultLocalPort);

    [[nodiscard]] static Result<std::unique_ptr<DiscoveryTransport>, Error>
    create(const DiscoveryConfig& config);

    /**
     * Transport over an already prepared channel.
     */
    [[nodiscard]] static Result<std::unique_ptr<DiscoveryTransport>, Error>
    with_socket(const Endpoint& group, Socket socket);

    DiscoveryTransport(const DiscoveryTransport&) = delete;
    DiscoveryTransport& operator=(const DiscoveryTransport&) = delete;

    /**
     * Run one session. Returns the unique devices in first-seen order, or a
     * TransportSend error when the query could not be sent.
     */
    Result<std::vector<Device>, Error> discover(std::chrono::milliseconds timeout);

    [[nodiscard]] const Endpoint& group() const { return group_; }
    [[nodiscard]] uint16_t local_port() const { return socket_->local_port(); }

    // Called once for every device kept by the session, as it is found.
    std::function<void(const Device&)> on_device_discovered;

private:
    DiscoveryTransport(Endpoint group, Socket socket);

    void handle_datagram(const Datagram& datagram, DedupeCollector& collector);

    Endpoint group_;
    Socket socket_;
};

} // namespace lumen::network

#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <QString>
#include <chrono>
#include <cstdint>

namespace lumen {

inline constexpr const char* kMulticastAddress = "239.255.255.250";
inline constexpr uint16_t kMulticastPort = 1982;
inline constexpr uint16_t kDefaultLocalPort = 7821;
inline constexpr std::chrono::milliseconds kDefaultDiscoveryTimeout{3000};

/**
 * DiscoveryConfig - Where to search and for how long.
 *
 * Environment overrides:
 * - LUMEN_MULTICAST_GROUP=<a.b.c.d:port>
 * - LUMEN_LOCAL_PORT=<port>
 * - LUMEN_DISCOVERY_TIMEOUT_MS=<milliseconds>
 */
struct DiscoveryConfig {
    Endpoint group;
    uint16_t local_port = kDefaultLocalPort;
    std::chrono::milliseconds timeout = kDefaultDiscoveryTimeout;

    [[nodiscard]] static DiscoveryConfig defaults();

    /**
     * Defaults with environment overrides applied. A set but unparseable
     * variable is a Configuration error rather than silently ignored.
     */
    [[nodiscard]] static Result<DiscoveryConfig, Error> from_environment();
};

[[nodiscard]] Endpoint default_multicast_group();

// Parses "a.b.c.d:port". IPv4 only; port must be 1-65535.
[[nodiscard]] Result<Endpoint, Error> parse_endpoint(const QString& text);

[[nodiscard]] Result<uint16_t, Error> parse_port(const QString& text);

[[nodiscard]] Result<std::chrono::milliseconds, Error> parse_timeout_ms(const QString& text);

} // namespace lumen

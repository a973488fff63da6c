#include "core/config.hpp"

#include <QtGlobal>

namespace lumen {
namespace {

constexpr const char* kGroupEnv = "LUMEN_MULTICAST_GROUP";
constexpr const char* kLocalPortEnv = "LUMEN_LOCAL_PORT";
constexpr const char* kTimeoutEnv = "LUMEN_DISCOVERY_TIMEOUT_MS";

Error env_error(const char* name, const Error& cause) {
    return Error::configuration(std::string(name) + ": " + cause.message);
}

} // namespace

Endpoint default_multicast_group() {
    return Endpoint{QHostAddress(QString::fromLatin1(kMulticastAddress)), kMulticastPort};
}

DiscoveryConfig DiscoveryConfig::defaults() {
    DiscoveryConfig config;
    config.group = default_multicast_group();
    return config;
}

Result<DiscoveryConfig, Error> DiscoveryConfig::from_environment() {
    auto config = defaults();

    if (qEnvironmentVariableIsSet(kGroupEnv)) {
        auto group = parse_endpoint(qEnvironmentVariable(kGroupEnv));
        if (group.is_err()) {
            return Result<DiscoveryConfig, Error>::err(env_error(kGroupEnv, group.unwrap_err()));
        }
        config.group = group.unwrap();
    }

    if (qEnvironmentVariableIsSet(kLocalPortEnv)) {
        auto port = parse_port(qEnvironmentVariable(kLocalPortEnv));
        if (port.is_err()) {
            return Result<DiscoveryConfig, Error>::err(env_error(kLocalPortEnv, port.unwrap_err()));
        }
        config.local_port = port.unwrap();
    }

    if (qEnvironmentVariableIsSet(kTimeoutEnv)) {
        auto timeout = parse_timeout_ms(qEnvironmentVariable(kTimeoutEnv));
        if (timeout.is_err()) {
            return Result<DiscoveryConfig, Error>::err(env_error(kTimeoutEnv, timeout.unwrap_err()));
        }
        config.timeout = timeout.unwrap();
    }

    return Result<DiscoveryConfig, Error>::ok(std::move(config));
}

Result<uint16_t, Error> parse_port(const QString& text) {
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok, 10);
    if (!ok || value == 0 || value > 65535) {
        return Result<uint16_t, Error>::err(
            Error::configuration("invalid port '" + text.toStdString() + "'"));
    }
    return Result<uint16_t, Error>::ok(static_cast<uint16_t>(value));
}

Result<std::chrono::milliseconds, Error> parse_timeout_ms(const QString& text) {
    bool ok = false;
    const qlonglong value = text.trimmed().toLongLong(&ok, 10);
    if (!ok || value < 0) {
        return Result<std::chrono::milliseconds, Error>::err(
            Error::configuration("invalid timeout '" + text.toStdString() + "'"));
    }
    return Result<std::chrono::milliseconds, Error>::ok(std::chrono::milliseconds(value));
}

Result<Endpoint, Error> parse_endpoint(const QString& text) {
    const auto trimmed = text.trimmed();
    const auto colon = trimmed.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return Result<Endpoint, Error>::err(
            Error::configuration("expected <address>:<port>, got '" + text.toStdString() + "'"));
    }

    QHostAddress address;
    if (!address.setAddress(trimmed.left(colon)) ||
        address.protocol() != QAbstractSocket::IPv4Protocol) {
        return Result<Endpoint, Error>::err(
            Error::configuration("invalid IPv4 address in '" + text.toStdString() + "'"));
    }

    auto port = parse_port(trimmed.mid(colon + 1));
    if (port.is_err()) {
        return Result<Endpoint, Error>::err(port.unwrap_err());
    }

    return Result<Endpoint, Error>::ok(Endpoint{address, port.unwrap()});
}

} // namespace lumen

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/device_listing.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/device_connection.hpp"
#include "network/discovery_transport.hpp"

namespace {

int fail(const lumen::Error& error) {
    QTextStream(stderr) << "lumen-discover: " << QString::fromStdString(error.message) << Qt::endl;
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lumen-discover"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Find smart lights on the local network."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption groupOption(
        QStringList{QStringLiteral("g"), QStringLiteral("group")},
        QStringLiteral("Multicast group to search (default 239.255.255.250:1982)."),
        QStringLiteral("address:port"));
    parser.addOption(groupOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Local port to bind (default 7821)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("t"), QStringLiteral("timeout")},
        QStringLiteral("How long to collect responses, in milliseconds (default 3000)."),
        QStringLiteral("ms"));
    parser.addOption(timeoutOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption commandsOption(
        QStringList{QStringLiteral("commands")},
        QStringLiteral("Include each device's supported commands."));
    parser.addOption(commandsOption);

    const QCommandLineOption connectOption(
        QStringList{QStringLiteral("connect")},
        QStringLiteral("Open a control connection to every device found and report the outcome."));
    parser.addOption(connectOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable discovery debug logging (also LUMEN_DEBUG_DISCOVERY=1)."));
    parser.addOption(debugOption);

    parser.process(app);

    lumen::install_log_handler();
    if (parser.isSet(debugOption)) {
        lumen::enable_debug_logging();
    }

    auto env = lumen::DiscoveryConfig::from_environment();
    if (env.is_err()) {
        return fail(env.unwrap_err());
    }
    auto config = env.unwrap();

    if (parser.isSet(groupOption)) {
        auto group = lumen::parse_endpoint(parser.value(groupOption));
        if (group.is_err()) return fail(group.unwrap_err());
        config.group = group.unwrap();
    }
    if (parser.isSet(portOption)) {
        auto port = lumen::parse_port(parser.value(portOption));
        if (port.is_err()) return fail(port.unwrap_err());
        config.local_port = port.unwrap();
    }
    if (parser.isSet(timeoutOption)) {
        auto timeout = lumen::parse_timeout_ms(parser.value(timeoutOption));
        if (timeout.is_err()) return fail(timeout.unwrap_err());
        config.timeout = timeout.unwrap();
    }

    auto transport = lumen::network::DiscoveryTransport::create(config);
    if (transport.is_err()) {
        return fail(transport.unwrap_err());
    }

    auto devices = transport.unwrap()->discover(config.timeout);
    if (devices.is_err()) {
        return fail(devices.unwrap_err());
    }

    const lumen::cli::ListingOptions options{.includeLocation = true,
                                             .includeCommands = parser.isSet(commandsOption)};
    const auto& found = devices.unwrap();
    QTextStream(stdout) << (parser.isSet(jsonOption)
                                ? lumen::cli::format_device_json(found, options)
                                : lumen::cli::format_device_table(found, options));

    if (parser.isSet(connectOption)) {
        QTextStream out(stdout);
        for (const auto& device : found) {
            auto connection = lumen::network::DeviceConnection::open(device);
            if (connection.is_ok()) {
                out << "connect " << device.id() << ": ok" << Qt::endl;
            } else {
                out << "connect " << device.id() << ": "
                    << QString::fromStdString(connection.unwrap_err().message) << Qt::endl;
            }
        }
    }

    return 0;
}

#include "cli/device_listing.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <algorithm>

namespace lumen::cli {

namespace {

[[nodiscard]] std::vector<const Device*> sorted_by_id(const std::vector<Device>& devices) {
    std::vector<const Device*> out;
    out.reserve(devices.size());
    for (const auto& d : devices) {
        out.push_back(&d);
    }
    std::sort(out.begin(), out.end(), [](const Device* a, const Device* b) {
        return a->id() < b->id();
    });
    return out;
}

[[nodiscard]] QStringList sorted_commands(const Device& device) {
    QStringList commands(device.supported_commands().cbegin(), device.supported_commands().cend());
    commands.sort();
    return commands;
}

[[nodiscard]] QString display_name(const Device& device) {
    return device.name().isEmpty() ? QStringLiteral("(unnamed)") : device.name();
}

[[nodiscard]] QJsonObject to_json(const Device& device, const ListingOptions& options) {
    QJsonObject rgb;
    rgb.insert(QStringLiteral("r"), device.rgb().red);
    rgb.insert(QStringLiteral("g"), device.rgb().green);
    rgb.insert(QStringLiteral("b"), device.rgb().blue);

    QJsonObject obj;
    obj.insert(QStringLiteral("id"), device.id());
    obj.insert(QStringLiteral("model"), device.model());
    obj.insert(QStringLiteral("firmwareVersion"), device.firmware_version());
    obj.insert(QStringLiteral("power"), to_string(device.power()));
    obj.insert(QStringLiteral("brightness"), device.brightness());
    obj.insert(QStringLiteral("colorMode"), to_string(device.color_mode()));
    obj.insert(QStringLiteral("colorTemperature"), device.color_temperature());
    obj.insert(QStringLiteral("rgb"), rgb);
    obj.insert(QStringLiteral("hue"), device.hue());
    obj.insert(QStringLiteral("saturation"), device.saturation());
    obj.insert(QStringLiteral("name"), device.name());

    if (options.includeLocation) {
        obj.insert(QStringLiteral("location"), device.location().to_string());
    }
    if (options.includeCommands) {
        obj.insert(QStringLiteral("support"), QJsonArray::fromStringList(sorted_commands(device)));
    }
    return obj;
}

} // namespace

QString format_device_table(const std::vector<Device>& devices, const ListingOptions& options) {
    if (devices.empty()) {
        return QStringLiteral("No devices found.\n");
    }

    QStringList lines;
    for (const auto* device : sorted_by_id(devices)) {
        auto line = device->id() + QStringLiteral("  ") + device->model() + QStringLiteral("  ") +
                    to_string(device->power()) + QStringLiteral("  ") + display_name(*device);
        if (options.includeLocation) {
            line += QStringLiteral(" (") + device->location().to_string() + QStringLiteral(")");
        }
        lines.append(line);
        if (options.includeCommands) {
            lines.append(QStringLiteral("    supports: ") + sorted_commands(*device).join(QLatin1Char(' ')));
        }
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_device_json(const std::vector<Device>& devices, const ListingOptions& options) {
    QJsonArray array;
    for (const auto* device : sorted_by_id(devices)) {
        array.append(to_json(*device, options));
    }

    QJsonObject root;
    root.insert(QStringLiteral("devices"), array);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace lumen::cli

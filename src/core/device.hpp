#pragma once

#include "core/result.hpp"

#include <QHash>
#include <QHostAddress>
#include <QSet>
#include <QString>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lumen {

/**
 * Endpoint - IPv4 address and port of a device or multicast group.
 */
struct Endpoint {
    QHostAddress address;
    uint16_t port = 0;

    [[nodiscard]] QString to_string() const {
        return address.toString() + QLatin1Char(':') + QString::number(port);
    }

    bool operator==(const Endpoint& other) const {
        return address == other.address && port == other.port;
    }
};

enum class PowerState {
    On,
    Off,
};

/**
 * ColorMode - Which of the color fields is live.
 *
 * The numeric values are the codes a device reports in `color_mode`.
 */
enum class ColorMode : uint8_t {
    Color = 1,
    ColorTemperature = 2,
    Hsv = 3,
};

[[nodiscard]] std::optional<PowerState> power_state_from_string(std::string_view text);
[[nodiscard]] std::optional<ColorMode> color_mode_from_code(unsigned code);

[[nodiscard]] QString to_string(PowerState power);
[[nodiscard]] QString to_string(ColorMode mode);

struct Rgb {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    static constexpr uint32_t MAX_PACKED = 0xFFFFFF;

    [[nodiscard]] static constexpr Rgb from_packed(uint32_t value) noexcept {
        return Rgb{static_cast<uint8_t>((value >> 16) & 0xFF),
                   static_cast<uint8_t>((value >> 8) & 0xFF),
                   static_cast<uint8_t>(value & 0xFF)};
    }

    [[nodiscard]] constexpr uint32_t packed() const noexcept {
        return (static_cast<uint32_t>(red) << 16) |
               (static_cast<uint32_t>(green) << 8) |
               static_cast<uint32_t>(blue);
    }

    bool operator==(const Rgb&) const = default;
};

class Device;

namespace network {
[[nodiscard]] Result<Device, Error> decode_device(const QHash<QString, QString>& headers,
                                                  const Endpoint& location);
} // namespace network

/**
 * Device - One light discovered on the LAN.
 *
 * Built only by the decoder, and only when every advertised field is present
 * and well-formed. Immutable afterwards.
 *
 * Identity is the firmware `id`. Two Device values with the same id are the
 * same device even if location or state differ (the address may change with
 * DHCP, the id does not).
 */
class Device {
public:
    struct Properties {
        QString id;
        QString model;
        uint8_t firmware_version = 0;
        QSet<QString> supported_commands;
        PowerState power = PowerState::Off;
        uint8_t brightness = 0;
        ColorMode color_mode = ColorMode::Color;
        // Only meaningful for ColorMode::ColorTemperature.
        uint16_t color_temperature = 0;
        // Only meaningful for ColorMode::Color.
        Rgb rgb;
        // Only meaningful for ColorMode::Hsv.
        uint16_t hue = 0;
        uint8_t saturation = 0;
        QString name;
    };

    [[nodiscard]] const QString& identity() const noexcept { return props_.id; }

    [[nodiscard]] const Endpoint& location() const noexcept { return location_; }
    [[nodiscard]] const QString& id() const noexcept { return props_.id; }
    [[nodiscard]] const QString& model() const noexcept { return props_.model; }
    [[nodiscard]] uint8_t firmware_version() const noexcept { return props_.firmware_version; }
    [[nodiscard]] const QSet<QString>& supported_commands() const noexcept {
        return props_.supported_commands;
    }
    [[nodiscard]] PowerState power() const noexcept { return props_.power; }
    [[nodiscard]] uint8_t brightness() const noexcept { return props_.brightness; }
    [[nodiscard]] ColorMode color_mode() const noexcept { return props_.color_mode; }
    [[nodiscard]] uint16_t color_temperature() const noexcept { return props_.color_temperature; }
    [[nodiscard]] const Rgb& rgb() const noexcept { return props_.rgb; }
    [[nodiscard]] uint16_t hue() const noexcept { return props_.hue; }
    [[nodiscard]] uint8_t saturation() const noexcept { return props_.saturation; }
    [[nodiscard]] const QString& name() const noexcept { return props_.name; }

    [[nodiscard]] bool supports(const QString& command) const {
        return props_.supported_commands.contains(command);
    }

    bool operator==(const Device& other) const {
        return props_.id == other.props_.id;
    }

private:
    friend Result<Device, Error> network::decode_device(const QHash<QString, QString>& headers,
                                                        const Endpoint& location);

    Device(Endpoint location, Properties properties)
        : location_(std::move(location)), props_(std::move(properties)) {}

    Endpoint location_;
    Properties props_;
};

inline size_t qHash(const Device& device, size_t seed = 0) noexcept {
    return ::qHash(device.identity(), seed);
}

} // namespace lumen

#include "network/device_decoder.hpp"

#include <QStringList>
#include <QUrl>

namespace lumen::network {
namespace {

/**
 * Look up one header and convert it.
 *
 * `parse` maps the raw value to std::optional<T>; an empty optional becomes
 * FieldInvalid carrying the raw text.
 */
template<typename T, typename Parse>
Result<T, Error> read_field(const HeaderMap& headers, const char* name, Parse&& parse) {
    const auto it = headers.constFind(QString::fromLatin1(name));
    if (it == headers.cend()) {
        return Result<T, Error>::err(Error::field_missing(name));
    }

    std::optional<T> value = parse(it.value());
    if (!value) {
        return Result<T, Error>::err(Error::field_invalid(name, it.value().toStdString()));
    }
    return Result<T, Error>::ok(std::move(*value));
}

// Reads fields in call order and stops at the first failure.
class FieldReader {
public:
    explicit FieldReader(const HeaderMap& headers) : headers_(headers) {}

    template<typename T, typename Parse>
    T read(const char* name, Parse&& parse) {
        if (error_) {
            return T{};
        }
        auto field = read_field<T>(headers_, name, std::forward<Parse>(parse));
        if (field.is_err()) {
            error_ = field.unwrap_err();
            return T{};
        }
        return std::move(field).unwrap();
    }

    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    const HeaderMap& headers_;
    std::optional<Error> error_;
};

std::optional<QString> as_text(const QString& raw) {
    return raw;
}

std::optional<QSet<QString>> as_command_set(const QString& raw) {
    const auto tokens = raw.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    return QSet<QString>(tokens.cbegin(), tokens.cend());
}

std::optional<PowerState> as_power(const QString& raw) {
    return power_state_from_string(raw.toStdString());
}

std::optional<ColorMode> as_color_mode(const QString& raw) {
    const auto code = parse_unsigned<uint8_t>(raw);
    if (!code) return std::nullopt;
    return color_mode_from_code(*code);
}

std::optional<Rgb> as_rgb(const QString& raw) {
    const auto packed = parse_unsigned<uint32_t>(raw);
    if (!packed || *packed > Rgb::MAX_PACKED) return std::nullopt;
    return Rgb::from_packed(*packed);
}

template<typename T>
std::optional<T> as_unsigned(const QString& raw) {
    return parse_unsigned<T>(raw);
}

} // namespace

Result<Device, Error> decode_device(const HeaderMap& headers, const Endpoint& location) {
    FieldReader reader(headers);

    Device::Properties props;
    props.id = reader.read<QString>("id", as_text);
    props.model = reader.read<QString>("model", as_text);
    props.firmware_version = reader.read<uint8_t>("fw_ver", as_unsigned<uint8_t>);
    props.power = reader.read<PowerState>("power", as_power);
    props.supported_commands = reader.read<QSet<QString>>("support", as_command_set);
    props.brightness = reader.read<uint8_t>("bright", as_unsigned<uint8_t>);
    props.color_mode = reader.read<ColorMode>("color_mode", as_color_mode);
    props.color_temperature = reader.read<uint16_t>("ct", as_unsigned<uint16_t>);
    props.rgb = reader.read<Rgb>("rgb", as_rgb);
    props.hue = reader.read<uint16_t>("hue", as_unsigned<uint16_t>);
    props.saturation = reader.read<uint8_t>("sat", as_unsigned<uint8_t>);
    props.name = reader.read<QString>("name", as_text);

    if (reader.error()) {
        return Result<Device, Error>::err(*reader.error());
    }
    return Result<Device, Error>::ok(Device(location, std::move(props)));
}

Endpoint resolve_location(const HeaderMap& headers, const Endpoint& source) {
    const auto it = headers.constFind(QStringLiteral("Location"));
    if (it == headers.cend()) {
        return source;
    }

    const QUrl url(it.value(), QUrl::StrictMode);
    if (!url.isValid() || url.port() <= 0) {
        return source;
    }

    QHostAddress address;
    if (!address.setAddress(url.host()) || address.protocol() != QAbstractSocket::IPv4Protocol) {
        return source;
    }
    return Endpoint{address, static_cast<uint16_t>(url.port())};
}

} // namespace lumen::network

#include <catch2/catch_test_macros.hpp>

#include "network/device_decoder.hpp"
#include "support/advertisements.hpp"

#include <QHash>

#include <array>
#include <string>
#include <type_traits>

using namespace lumen;
using namespace lumen::network;

namespace {

const Endpoint kLocation{QHostAddress(QStringLiteral("192.168.0.42")), 1234};

Device decode_ok(const HeaderMap& headers) {
    auto result = decode_device(headers, kLocation);
    REQUIRE(result.is_ok());
    return std::move(result).unwrap();
}

Error decode_err(const HeaderMap& headers) {
    auto result = decode_device(headers, kLocation);
    REQUIRE(result.is_err());
    return result.unwrap_err();
}

HeaderMap with(const char* field, const char* value) {
    auto headers = test::sample_headers();
    headers.insert(QString::fromLatin1(field), QString::fromLatin1(value));
    return headers;
}

} // namespace

TEST_CASE("DeviceDecoder: decodes every field of a complete advertisement", "[unit][decoder]") {
    const auto device = decode_ok(test::sample_headers());

    REQUIRE(device.location() == kLocation);
    REQUIRE(device.id() == QStringLiteral("0x1234"));
    REQUIRE(device.identity() == QStringLiteral("0x1234"));
    REQUIRE(device.model() == QStringLiteral("floor"));
    REQUIRE(device.firmware_version() == 40);
    REQUIRE(device.power() == PowerState::On);
    REQUIRE(device.brightness() == 34);
    REQUIRE(device.color_mode() == ColorMode::ColorTemperature);
    REQUIRE(device.color_temperature() == 0);
    REQUIRE(device.rgb() == Rgb{10, 10, 10});
    REQUIRE(device.hue() == 314);
    REQUIRE(device.saturation() == 12);
    REQUIRE(device.name() == QStringLiteral("room_light"));
    REQUIRE(device.supported_commands() ==
            QSet<QString>{QStringLiteral("get_power"), QStringLiteral("set_power"),
                          QStringLiteral("get_rgb"), QStringLiteral("set_rgb")});
    REQUIRE(device.supports(QStringLiteral("set_rgb")));
    REQUIRE_FALSE(device.supports(QStringLiteral("set_hsv")));
}

TEST_CASE("DeviceDecoder: is the only way to build a Device", "[unit][decoder]") {
    STATIC_REQUIRE_FALSE(std::is_constructible_v<Device, Endpoint, Device::Properties>);
    STATIC_REQUIRE_FALSE(std::is_default_constructible_v<Device>);

    const auto device = decode_ok(test::sample_headers());
    const Device copy = device;
    REQUIRE(copy == device);
    REQUIRE(copy.location() == kLocation);
}

TEST_CASE("DeviceDecoder: each missing field is named", "[unit][decoder]") {
    const std::array<const char*, 12> fields{
        "id", "model", "fw_ver", "power", "support", "bright",
        "color_mode", "ct", "rgb", "hue", "sat", "name"};

    for (const auto* field : fields) {
        auto headers = test::sample_headers();
        REQUIRE(headers.remove(QString::fromLatin1(field)) == 1);

        const auto error = decode_err(headers);
        INFO("field " << field);
        REQUIRE(error.kind == ErrorKind::FieldMissing);
        REQUIRE(error.field == field);
    }
}

TEST_CASE("DeviceDecoder: first failing field wins", "[unit][decoder]") {
    auto headers = test::sample_headers();
    headers.remove(QStringLiteral("name"));
    headers.insert(QStringLiteral("fw_ver"), QStringLiteral("x"));
    headers.remove(QStringLiteral("model"));

    const auto error = decode_err(headers);
    REQUIRE(error.kind == ErrorKind::FieldMissing);
    REQUIRE(error.field == "model");
}

TEST_CASE("DeviceDecoder: rgb unpacks a 24-bit integer", "[unit][decoder]") {
    SECTION("657930 is 0x0A0A0A") {
        REQUIRE(decode_ok(with("rgb", "657930")).rgb() == Rgb{10, 10, 10});
    }

    SECTION("16711680 is pure red") {
        REQUIRE(decode_ok(with("rgb", "16711680")).rgb() == Rgb{255, 0, 0});
    }

    SECTION("Above 24 bits is invalid") {
        const auto error = decode_err(with("rgb", "16777216"));
        REQUIRE(error.kind == ErrorKind::FieldInvalid);
        REQUIRE(error.field == "rgb");
        REQUIRE(error.raw_value == "16777216");
    }
}

TEST_CASE("DeviceDecoder: color_mode codes", "[unit][decoder]") {
    REQUIRE(decode_ok(with("color_mode", "1")).color_mode() == ColorMode::Color);
    REQUIRE(decode_ok(with("color_mode", "2")).color_mode() == ColorMode::ColorTemperature);
    REQUIRE(decode_ok(with("color_mode", "3")).color_mode() == ColorMode::Hsv);

    for (const auto* raw : {"0", "4", "255", "hsv"}) {
        INFO("color_mode " << raw);
        const auto error = decode_err(with("color_mode", raw));
        REQUIRE(error.kind == ErrorKind::FieldInvalid);
        REQUIRE(error.field == "color_mode");
    }
}

TEST_CASE("DeviceDecoder: power is exactly on or off", "[unit][decoder]") {
    REQUIRE(decode_ok(with("power", "off")).power() == PowerState::Off);

    for (const auto* raw : {"ON", "Off", "1", ""}) {
        INFO("power '" << raw << "'");
        const auto error = decode_err(with("power", raw));
        REQUIRE(error.kind == ErrorKind::FieldInvalid);
        REQUIRE(error.raw_value == raw);
    }
}

TEST_CASE("DeviceDecoder: support is a whitespace-separated set", "[unit][decoder]") {
    SECTION("Empty string gives an empty set") {
        REQUIRE(decode_ok(with("support", "")).supported_commands().isEmpty());
    }

    SECTION("Tokens become set members") {
        REQUIRE(decode_ok(with("support", "a b c")).supported_commands() ==
                QSet<QString>{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});
    }

    SECTION("Repeated and padded tokens collapse") {
        REQUIRE(decode_ok(with("support", "  a\tb  a ")).supported_commands() ==
                QSet<QString>{QStringLiteral("a"), QStringLiteral("b")});
    }
}

TEST_CASE("DeviceDecoder: integers are strict and range-checked", "[unit][decoder]") {
    SECTION("Width limits") {
        REQUIRE(decode_ok(with("bright", "255")).brightness() == 255);
        REQUIRE(decode_err(with("bright", "256")).kind == ErrorKind::FieldInvalid);
        REQUIRE(decode_ok(with("ct", "65535")).color_temperature() == 65535);
        REQUIRE(decode_err(with("ct", "65536")).kind == ErrorKind::FieldInvalid);
        REQUIRE(decode_err(with("hue", "70000")).kind == ErrorKind::FieldInvalid);
        REQUIRE(decode_err(with("sat", "300")).kind == ErrorKind::FieldInvalid);
    }

    SECTION("Non-decimal input") {
        for (const auto* raw : {"", "-1", "+5", "4.0", "0x10", " 40", "40 ", "forty"}) {
            INFO("fw_ver '" << raw << "'");
            const auto error = decode_err(with("fw_ver", raw));
            REQUIRE(error.kind == ErrorKind::FieldInvalid);
            REQUIRE(error.field == "fw_ver");
            REQUIRE(error.raw_value == raw);
        }
    }
}

TEST_CASE("DeviceDecoder: empty name and model strings are allowed", "[unit][decoder]") {
    auto headers = with("name", "");
    headers.insert(QStringLiteral("model"), QString());

    const auto device = decode_ok(headers);
    REQUIRE(device.name().isEmpty());
    REQUIRE(device.model().isEmpty());
}

TEST_CASE("DeviceDecoder: equality follows the id only", "[unit][decoder]") {
    const auto first = decode_ok(test::sample_headers());
    const auto second = decode_ok(test::sample_headers());
    REQUIRE(first == second);

    const auto changed = decode_ok(with("power", "off"));
    REQUIRE(changed == first);
    REQUIRE(qHash(changed) == qHash(first));

    const auto other = decode_ok(with("id", "0x5678"));
    REQUIRE_FALSE(other == first);
}

TEST_CASE("DeviceDecoder: resolve_location prefers a usable Location header", "[unit][decoder]") {
    const Endpoint source{QHostAddress(QStringLiteral("192.168.1.239")), 1982};
    auto headers = test::sample_headers();

    SECTION("No header falls back to the source") {
        REQUIRE(resolve_location(headers, source) == source);
    }

    SECTION("Control port from the header") {
        headers.insert(QStringLiteral("Location"), QStringLiteral("yeelight://192.168.1.239:55443"));
        const auto location = resolve_location(headers, source);
        REQUIRE(location.address == QHostAddress(QStringLiteral("192.168.1.239")));
        REQUIRE(location.port == 55443);
    }

    SECTION("Unusable header falls back to the source") {
        for (const auto* raw : {"yeelight://192.168.1.239", "yeelight://bulb.local:55443", "garbage"}) {
            INFO("Location " << raw);
            headers.insert(QStringLiteral("Location"), QString::fromLatin1(raw));
            REQUIRE(resolve_location(headers, source) == source);
        }
    }
}

TEST_CASE("parse_unsigned: only ASCII digits are accepted", "[unit][decoder]") {
    // Arabic-Indic three, fullwidth "12" and superscript two are all digits to
    // Unicode but not to the wire format.
    REQUIRE_FALSE(parse_unsigned<uint16_t>(QString(QChar(0x0663))).has_value());
    REQUIRE_FALSE(parse_unsigned<uint16_t>(QString::fromUtf16(u"\uFF11\uFF12")).has_value());
    REQUIRE_FALSE(parse_unsigned<uint8_t>(QString(QChar(0x00B2))).has_value());
    REQUIRE_FALSE(parse_unsigned<uint8_t>(QStringLiteral("1") + QChar(0x00B2)).has_value());
    REQUIRE_FALSE(parse_unsigned<uint8_t>(QString()).has_value());
    REQUIRE(parse_unsigned<uint8_t>(QStringLiteral("12")) == uint8_t{12});
}

TEST_CASE("parse_unsigned: bounds per width", "[unit][decoder]") {
    REQUIRE(parse_unsigned<uint8_t>(QStringLiteral("0")) == uint8_t{0});
    REQUIRE(parse_unsigned<uint8_t>(QStringLiteral("255")) == uint8_t{255});
    REQUIRE_FALSE(parse_unsigned<uint8_t>(QStringLiteral("256")).has_value());
    REQUIRE(parse_unsigned<uint32_t>(QStringLiteral("4294967295")) == uint32_t{4294967295u});
    REQUIRE_FALSE(parse_unsigned<uint32_t>(QStringLiteral("4294967296")).has_value());
    REQUIRE_FALSE(parse_unsigned<uint16_t>(QStringLiteral("99999999999999999999999")).has_value());
}

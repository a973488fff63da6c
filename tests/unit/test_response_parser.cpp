#include <catch2/catch_test_macros.hpp>

#include "network/response_parser.hpp"
#include "support/advertisements.hpp"

using namespace lumen;
using namespace lumen::network;

TEST_CASE("ResponseParser: parses status line and headers", "[unit][parser]") {
    const auto parsed = parse_response(test::advertisement(QStringLiteral("0x0000000002dfb19a")));
    REQUIRE(parsed.is_ok());

    const auto& response = parsed.unwrap();
    REQUIRE(response.status_code == 200);
    REQUIRE(response.reason == QStringLiteral("OK"));
    REQUIRE(response.headers.size() == 17);
    REQUIRE(response.headers.value(QStringLiteral("id")) == QStringLiteral("0x0000000002dfb19a"));
    REQUIRE(response.headers.value(QStringLiteral("Location")) == QStringLiteral("yeelight://192.168.1.239:55443"));
    REQUIRE(response.headers.value(QStringLiteral("Date")).isEmpty());
}

TEST_CASE("ResponseParser: header names are case-sensitive", "[unit][parser]") {
    const auto parsed = parse_response(QByteArray("HTTP/1.1 200 OK\r\nID: upper\r\nid: lower\r\n"));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().headers.value(QStringLiteral("ID")) == QStringLiteral("upper"));
    REQUIRE(parsed.unwrap().headers.value(QStringLiteral("id")) == QStringLiteral("lower"));
}

TEST_CASE("ResponseParser: duplicate header keeps the last value", "[unit][parser]") {
    const auto parsed = parse_response(QByteArray("HTTP/1.1 200 OK\r\nname: first\r\nname: second\r\n"));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().headers.value(QStringLiteral("name")) == QStringLiteral("second"));
}

TEST_CASE("ResponseParser: strips NUL padding from a fixed buffer", "[unit][parser]") {
    QByteArray buffer("HTTP/1.1 200 OK\r\nid: 0x1\r\n");
    buffer.append(QByteArray(64, '\0'));

    const auto parsed = parse_response(buffer);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().headers.value(QStringLiteral("id")) == QStringLiteral("0x1"));
}

TEST_CASE("ResponseParser: invalid UTF-8 is replaced, not rejected", "[unit][parser]") {
    QByteArray buffer("HTTP/1.1 200 OK\r\nname: lamp");
    buffer.append('\xff');
    buffer.append("\r\n");

    const auto parsed = parse_response(buffer);
    REQUIRE(parsed.is_ok());
    const auto name = parsed.unwrap().headers.value(QStringLiteral("name"));
    REQUIRE(name.startsWith(QStringLiteral("lamp")));
    REQUIRE(name.contains(QChar(QChar::ReplacementCharacter)));
}

TEST_CASE("ResponseParser: accepts bare LF line endings", "[unit][parser]") {
    const auto parsed = parse_response(QByteArray("HTTP/1.1 200 OK\nid: 0x2\nmodel: mono\n"));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().headers.size() == 2);
}

TEST_CASE("ResponseParser: stops at the blank line", "[unit][parser]") {
    const auto parsed = parse_response(QByteArray("HTTP/1.1 200 OK\r\nid: 0x3\r\n\r\nnot a header\r\n"));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().headers.size() == 1);
}

TEST_CASE("ResponseParser: header count limit", "[unit][parser]") {
    auto build = [](int count) {
        QByteArray bytes("HTTP/1.1 200 OK\r\n");
        for (int i = 0; i < count; ++i) {
            bytes.append("h" + QByteArray::number(i) + ": v\r\n");
        }
        return bytes;
    };

    SECTION("17 headers are accepted") {
        REQUIRE(parse_response(build(17)).is_ok());
    }

    SECTION("18 headers fail") {
        const auto parsed = parse_response(build(18));
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().kind == ErrorKind::Parse);
    }
}

TEST_CASE("ResponseParser: rejects malformed framing", "[unit][parser]") {
    SECTION("Empty datagram") {
        REQUIRE(parse_response(QByteArray()).is_err());
    }

    SECTION("Only padding") {
        REQUIRE(parse_response(QByteArray(32, '\0')).is_err());
    }

    SECTION("Request line instead of status line") {
        const auto parsed = parse_response(QByteArray("M-SEARCH * HTTP/1.1\r\nST: wifi_bulb\r\n"));
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().kind == ErrorKind::Parse);
    }

    SECTION("Non-numeric status code") {
        REQUIRE(parse_response(QByteArray("HTTP/1.1 OK\r\n")).is_err());
    }

    SECTION("Header without colon") {
        REQUIRE(parse_response(QByteArray("HTTP/1.1 200 OK\r\nid 0x1\r\n")).is_err());
    }

    SECTION("Header name with a space") {
        REQUIRE(parse_response(QByteArray("HTTP/1.1 200 OK\r\nbad name: x\r\n")).is_err());
    }
}

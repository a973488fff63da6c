#include "network/response_parser.hpp"

#include <QStringList>
#include <QStringView>

namespace lumen::network {
namespace {

QString strip_padding(const QByteArray& datagram) {
    qsizetype end = datagram.size();
    while (end > 0 && datagram.at(end - 1) == '\0') {
        --end;
    }
    // fromUtf8 never fails; invalid sequences are replaced.
    return QString::fromUtf8(datagram.constData(), end).trimmed();
}

bool is_digit(QChar c) {
    return c >= QLatin1Char('0') && c <= QLatin1Char('9');
}

// "HTTP/1.1 200 OK"
Result<ParsedResponse, Error> parse_status_line(const QString& line) {
    const auto parts = line.split(QLatin1Char(' '), Qt::KeepEmptyParts);
    if (parts.size() < 2) {
        return Result<ParsedResponse, Error>::err(Error::parse("malformed status line"));
    }

    const auto& version = parts.at(0);
    if (version.size() != 8 || !version.startsWith(QLatin1String("HTTP/1.")) ||
        !is_digit(version.at(7))) {
        return Result<ParsedResponse, Error>::err(
            Error::parse("unsupported protocol '" + version.toStdString() + "'"));
    }

    const auto& code = parts.at(1);
    if (code.size() != 3 || !is_digit(code.at(0)) || !is_digit(code.at(1)) || !is_digit(code.at(2))) {
        return Result<ParsedResponse, Error>::err(
            Error::parse("malformed status code '" + code.toStdString() + "'"));
    }

    ParsedResponse response;
    response.status_code = code.toInt();
    response.reason = parts.mid(2).join(QLatin1Char(' '));
    return Result<ParsedResponse, Error>::ok(std::move(response));
}

bool is_valid_header_name(QStringView name) {
    if (name.isEmpty()) return false;
    for (const auto c : name) {
        if (c.isSpace() || c.unicode() < 0x21 || c.unicode() > 0x7E) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<ParsedResponse, Error> parse_response(const QByteArray& datagram) {
    const auto text = strip_padding(datagram);
    if (text.isEmpty()) {
        return Result<ParsedResponse, Error>::err(Error::parse("empty datagram"));
    }

    auto lines = text.split(QLatin1Char('\n'));
    for (auto& line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }

    auto status = parse_status_line(lines.first());
    if (status.is_err()) {
        return status;
    }
    auto response = std::move(status).unwrap();

    std::size_t header_count = 0;
    for (qsizetype i = 1; i < lines.size(); ++i) {
        const auto& line = lines.at(i);
        if (line.isEmpty()) {
            break;
        }

        if (++header_count > kMaxHeaders) {
            return Result<ParsedResponse, Error>::err(Error::parse("too many headers"));
        }

        const auto colon = line.indexOf(QLatin1Char(':'));
        if (colon < 0) {
            return Result<ParsedResponse, Error>::err(
                Error::parse("header line without ':' '" + line.toStdString() + "'"));
        }

        const auto name = line.left(colon);
        if (!is_valid_header_name(name)) {
            return Result<ParsedResponse, Error>::err(
                Error::parse("invalid header name '" + name.toStdString() + "'"));
        }

        response.headers.insert(name, line.mid(colon + 1).trimmed());
    }

    return Result<ParsedResponse, Error>::ok(std::move(response));
}

} // namespace lumen::network
